#include "TrainingLoop.h"
#include <QDebug>
#include <QtConcurrent/QtConcurrentRun>
#include <utility>

TrainingLoop::TrainingLoop(const TrainingConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_session(std::make_unique<TrainingSession>(config))
{
    qRegisterMetaType<UpdateStats>("UpdateStats");

    m_updater = makeUpdater();

    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setInterval(m_config.tickIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &TrainingLoop::onTimerTick);
    connect(&m_watcher, &QFutureWatcherBase::finished, this, &TrainingLoop::onUpdateFinished);
}

TrainingLoop::~TrainingLoop()
{
    m_timer.stop();
    m_watcher.waitForFinished();
}

std::shared_ptr<PPOUpdater> TrainingLoop::makeUpdater() const
{
    const unsigned int seed = m_config.seed == 0 ? 0u : m_config.seed + 2u;
    return std::make_shared<PPOUpdater>(m_config.ppo, seed);
}

void TrainingLoop::start()
{
    m_paused = false;
    m_clock.start();
    m_timer.start();
    qInfo() << "Training started:" << m_session->numPoles() << "pole(s), tick"
            << m_config.tickIntervalMs << "ms";
}

void TrainingLoop::stop()
{
    m_timer.stop();
    qInfo() << "Training stopped after" << m_session->episodeCount() << "episodes";
}

void TrainingLoop::pause()
{
    if (m_paused) return;
    m_paused = true;
    m_timer.stop();
}

void TrainingLoop::resume()
{
    if (!m_paused) return;
    m_paused = false;
    // Time spent paused is not simulated
    m_clock.start();
    m_timer.start();
}

void TrainingLoop::onTimerTick()
{
    const double elapsed = static_cast<double>(m_clock.restart()) * m_config.timeScale;
    step(elapsed);
}

void TrainingLoop::step(double elapsedMillis)
{
    TickResult result = m_session->tick(elapsedMillis);

    if (result.diverged) {
        noteDivergence();
        return;
    }
    if (!result.episode) return;

    EpisodeBatch& batch = *result.episode;
    qInfo().nospace() << "Episode: " << batch.episode << " Total reward: " << batch.totalReward();
    emit episodeFinished(batch.episode, batch.steps(), batch.totalReward());

    submitUpdate(std::move(batch));
}

void TrainingLoop::submitUpdate(EpisodeBatch batch)
{
    if (batch.transitions.empty()) return;

    if (!m_config.asyncUpdates) {
        UpdateStats stats = m_updater->train(m_session->model(), batch.transitions);
        finishUpdate(batch.episode, stats, !stats.skipped && !stats.diverged);
        return;
    }

    m_pending.push_back(std::move(batch));
    while (static_cast<int>(m_pending.size()) > m_config.maxPendingUpdates) {
        qWarning() << "Update queue full, dropping episode" << m_pending.front().episode;
        m_pending.pop_front();
    }
    launchNextUpdate();
}

void TrainingLoop::launchNextUpdate()
{
    if (m_updateInFlight || m_pending.empty()) return;

    auto batch = std::make_shared<EpisodeBatch>(std::move(m_pending.front()));
    m_pending.pop_front();

    auto model = std::make_shared<ActorCritic>(m_session->model());
    std::shared_ptr<PPOUpdater> updater = m_updater;
    const quint64 generation = m_generation;

    m_updateInFlight = true;
    m_watcher.setFuture(QtConcurrent::run([batch, model, updater, generation]() {
        UpdateOutcome outcome;
        outcome.stats = updater->train(*model, batch->transitions);
        outcome.model = model;
        outcome.generation = generation;
        outcome.episode = batch->episode;
        return outcome;
    }));
}

void TrainingLoop::onUpdateFinished()
{
    m_updateInFlight = false;
    UpdateOutcome outcome = m_watcher.result();

    if (outcome.generation != m_generation) {
        qDebug() << "Discarding update for episode" << outcome.episode << "from a previous configuration";
    } else {
        const bool applied = !outcome.stats.skipped && !outcome.stats.diverged;
        if (applied) {
            m_session->model().copyParametersFrom(*outcome.model);
        }
        finishUpdate(outcome.episode, outcome.stats, applied);
    }

    launchNextUpdate();
}

void TrainingLoop::finishUpdate(int episode, const UpdateStats& stats, bool applied)
{
    if (stats.diverged) {
        qWarning() << "Update for episode" << episode << "diverged and was discarded";
        m_session->recordDivergence();
        noteDivergence();
    } else if (applied) {
        m_appliedUpdates++;
        m_session->clearDivergences();
        qDebug() << "Update for episode" << episode << "samples" << stats.samples
                 << "actor loss" << stats.actorLoss << "critic loss" << stats.criticLoss
                 << "entropy" << stats.entropy;
    }
    emit updateFinished(episode, stats, applied);
}

void TrainingLoop::noteDivergence()
{
    const int consecutive = m_session->consecutiveDivergences();
    emit divergenceDetected(consecutive);

    const int threshold = m_config.divergenceWarningThreshold;
    if (consecutive >= threshold && consecutive % threshold == 0) {
        qWarning() << "Training has diverged" << consecutive << "times in a row";
    }
}

bool TrainingLoop::reconfigure(int numPoles)
{
    std::string error;
    if (!m_session->reconfigure(numPoles, &error)) {
        qWarning() << "Rejected reconfiguration:" << QString::fromStdString(error);
        return false;
    }

    m_config.numPoles = numPoles;
    m_generation++;
    m_pending.clear();
    m_updater = makeUpdater();
    m_clock.start();

    qInfo() << "Reconfigured to" << numPoles << "pole(s)";
    emit reconfigured(numPoles);
    return true;
}

void TrainingLoop::resetSimulation()
{
    m_session->resetSimulation();
    m_clock.start();
}

void TrainingLoop::setGravity(double gravity)
{
    m_session->setGravity(gravity);
    m_config.physics.gravity = gravity;
}
