#ifndef TRAININGLOOP_H
#define TRAININGLOOP_H

#include <QObject>
#include <QTimer>
#include <QElapsedTimer>
#include <QFutureWatcher>
#include <QMetaType>
#include <deque>
#include <memory>
#include "PPOUpdater.h"
#include "TrainingSession.h"

Q_DECLARE_METATYPE(UpdateStats)

/**
 * @brief Fixed-rate driver for a TrainingSession
 *
 * A QTimer ticks the session every tickIntervalMs. The elapsed wall-clock
 * time (scaled by timeScale) decides how many physics steps each tick takes.
 *
 * A finished episode is trained on a copy of the model in a background
 * task. Ticks keep running meanwhile, so the next episode samples from the
 * parameters as they were before that update; the trained parameters are
 * copied into the live model when the task reports back on this thread.
 * Updates run one at a time, later episodes wait in a bounded queue.
 */
class TrainingLoop : public QObject
{
    Q_OBJECT

public:
    // Throws std::invalid_argument on an invalid configuration
    explicit TrainingLoop(const TrainingConfig& config, QObject* parent = nullptr);
    ~TrainingLoop() override;

    bool isRunning() const { return m_timer.isActive(); }
    bool isPaused() const { return m_paused; }
    bool isUpdating() const { return m_updateInFlight; }
    int pendingUpdates() const { return static_cast<int>(m_pending.size()); }
    int appliedUpdates() const { return m_appliedUpdates; }

    // Presentation surface
    Eigen::VectorXd simulationState() const { return m_session->physics().state(); }
    int numPoles() const { return m_session->numPoles(); }

    TrainingSession& session() { return *m_session; }
    const TrainingSession& session() const { return *m_session; }

    // One tick with an explicit elapsed time, bypassing the wall clock
    void step(double elapsedMillis);

public slots:
    void start();
    void stop();
    void pause();
    void resume();
    bool reconfigure(int numPoles);
    void resetSimulation();
    void setGravity(double gravity);

signals:
    void episodeFinished(int episode, int steps, double totalReward);
    void updateFinished(int episode, const UpdateStats& stats, bool applied);
    void divergenceDetected(int consecutive);
    void reconfigured(int numPoles);

private slots:
    void onTimerTick();
    void onUpdateFinished();

private:
    struct UpdateOutcome {
        std::shared_ptr<ActorCritic> model;
        UpdateStats stats;
        quint64 generation = 0;
        int episode = 0;
    };

    void submitUpdate(EpisodeBatch batch);
    void launchNextUpdate();
    void finishUpdate(int episode, const UpdateStats& stats, bool applied);
    void noteDivergence();
    std::shared_ptr<PPOUpdater> makeUpdater() const;

    TrainingConfig m_config;
    std::unique_ptr<TrainingSession> m_session;
    std::shared_ptr<PPOUpdater> m_updater;

    QTimer m_timer;
    QElapsedTimer m_clock;
    QFutureWatcher<UpdateOutcome> m_watcher;

    std::deque<EpisodeBatch> m_pending;
    quint64 m_generation = 0;       // bumped on reconfiguration
    bool m_updateInFlight = false;
    bool m_paused = false;
    int m_appliedUpdates = 0;
};

#endif // TRAININGLOOP_H
