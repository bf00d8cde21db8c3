#include "tp/GenerateWorker.h"

#include <QtCore/QString>

#include <cmath>
#include <exception>
#include <utility>

namespace tp
{

GenerateWorker::GenerateWorker(std::shared_ptr<const mesh::Model> model,
                               SelectionVolume selection,
                               MachiningParams params,
                               QObject* parent)
    : QThread(parent)
    , m_model(std::move(model))
    , m_selection(selection)
    , m_params(params)
{
    qRegisterMetaType<std::shared_ptr<tp::Path>>("std::shared_ptr<tp::Path>");
}

void GenerateWorker::requestCancel()
{
    m_cancelled.store(true, std::memory_order_relaxed);
}

void GenerateWorker::run()
{
    if (!m_model)
    {
        emit error(tr("Generation aborted: no model."));
        return;
    }

    emit progress(0);

    const auto progressCallback = [this](double fraction) {
        emit progress(static_cast<int>(std::lround(fraction * 100.0)));
    };

    Path result;
    try
    {
        result = m_generator.generate(*m_model, m_selection, m_params, m_cancelled, progressCallback);
    }
    catch (const PreconditionError& ex)
    {
        emit error(QString::fromStdString(ex.what()));
        return;
    }
    catch (const std::exception& ex)
    {
        emit error(tr("Path generation failed: %1").arg(QString::fromUtf8(ex.what())));
        return;
    }

    if (m_generator.wasCancelled())
    {
        emit cancelled(std::make_shared<Path>(std::move(result)));
        return;
    }

    emit progress(100);
    emit finished(std::make_shared<Path>(std::move(result)));
}

} // namespace tp
