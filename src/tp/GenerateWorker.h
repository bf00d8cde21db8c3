#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QThread>

#include "mesh/Model.h"
#include "tp/MachiningParams.h"
#include "tp/Path.h"
#include "tp/PathGenerator.h"
#include "tp/SelectionVolume.h"

#include <atomic>
#include <memory>

namespace tp
{

// Runs one generation on its own thread. The model is shared read-only and the selection
// and parameters are copied at construction, so the caller may keep editing its own.
class GenerateWorker : public QThread
{
    Q_OBJECT

public:
    GenerateWorker(std::shared_ptr<const mesh::Model> model,
                   SelectionVolume selection,
                   MachiningParams params,
                   QObject* parent = nullptr);

    void requestCancel();

Q_SIGNALS:
    void progress(int percent);
    void finished(std::shared_ptr<tp::Path> path);
    // Carries the layers completed before the cancel request was seen.
    void cancelled(std::shared_ptr<tp::Path> partialPath);
    void error(const QString& message);

protected:
    void run() override;

private:
    std::shared_ptr<const mesh::Model> m_model;
    SelectionVolume m_selection;
    MachiningParams m_params;
    PathGenerator m_generator;
    std::atomic<bool> m_cancelled{false};
};

} // namespace tp

Q_DECLARE_METATYPE(std::shared_ptr<tp::Path>)
