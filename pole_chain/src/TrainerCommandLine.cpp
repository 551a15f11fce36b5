#include "TrainerCommandLine.h"
#include <limits>

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) *error = message;
    return false;
}

}

TrainerCommandLine::TrainerCommandLine()
    : m_helpOption(m_parser.addHelpOption())
    , m_versionOption(m_parser.addVersionOption())
    , m_polesOption("poles", "Number of poles on the cart.", "count", "1")
    , m_seedOption("seed", "Random seed, 0 for a random one.", "seed", "0")
    , m_tickOption("tick-ms", "Scheduler period in milliseconds.", "ms", "20")
    , m_timeScaleOption("time-scale", "Simulated time per wall-clock time.", "factor", "1.0")
    , m_gravityOption("gravity", "Gravity in m/s^2.", "g", "9.8")
    , m_maxEpisodesOption("max-episodes", "Quit after this many episodes, 0 to run until stopped.", "count", "0")
    , m_syncOption("sync-updates", "Run each update before the next tick.")
    , m_normalizeOption("normalize-advantages", "Normalize advantages per episode.")
    , m_reshuffleOption("reshuffle-epochs", "Draw a new minibatch order every epoch.")
{
    m_parser.setApplicationDescription("Trains a PPO policy to balance a chain of poles on a cart");
    m_parser.addOption(m_polesOption);
    m_parser.addOption(m_seedOption);
    m_parser.addOption(m_tickOption);
    m_parser.addOption(m_timeScaleOption);
    m_parser.addOption(m_gravityOption);
    m_parser.addOption(m_maxEpisodesOption);
    m_parser.addOption(m_syncOption);
    m_parser.addOption(m_normalizeOption);
    m_parser.addOption(m_reshuffleOption);
}

bool TrainerCommandLine::readInt(const QCommandLineOption& option, int& out, QString* error) const
{
    if (!m_parser.isSet(option)) return true;
    bool ok = false;
    const int value = m_parser.value(option).toInt(&ok);
    if (!ok) {
        return fail(error, QString("Invalid value for --%1: %2").arg(option.names().first(), m_parser.value(option)));
    }
    out = value;
    return true;
}

bool TrainerCommandLine::readDouble(const QCommandLineOption& option, double& out, QString* error) const
{
    if (!m_parser.isSet(option)) return true;
    bool ok = false;
    const double value = m_parser.value(option).toDouble(&ok);
    if (!ok) {
        return fail(error, QString("Invalid value for --%1: %2").arg(option.names().first(), m_parser.value(option)));
    }
    out = value;
    return true;
}

bool TrainerCommandLine::readSeed(std::uint32_t& out, QString* error) const
{
    if (!m_parser.isSet(m_seedOption)) return true;
    bool ok = false;
    const qlonglong value = m_parser.value(m_seedOption).toLongLong(&ok);
    if (!ok || value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
        return fail(error, QString("Invalid value for --seed: %1, expected 0 or a positive integer")
                               .arg(m_parser.value(m_seedOption)));
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

bool TrainerCommandLine::parse(const QStringList& arguments, TrainerOptions& options, QString* error)
{
    if (!m_parser.parse(arguments)) return fail(error, m_parser.errorText());
    if (helpRequested() || versionRequested()) return true;

    TrainerOptions parsed;
    TrainingConfig& config = parsed.config;
    if (!readInt(m_polesOption, config.numPoles, error)
        || !readSeed(config.seed, error)
        || !readInt(m_tickOption, config.tickIntervalMs, error)
        || !readDouble(m_timeScaleOption, config.timeScale, error)
        || !readDouble(m_gravityOption, config.physics.gravity, error)
        || !readInt(m_maxEpisodesOption, parsed.maxEpisodes, error)) {
        return false;
    }
    if (parsed.maxEpisodes < 0) return fail(error, "--max-episodes must be >= 0");

    config.asyncUpdates = !m_parser.isSet(m_syncOption);
    config.ppo.normalizeAdvantages = m_parser.isSet(m_normalizeOption);
    config.ppo.reshuffleEachEpoch = m_parser.isSet(m_reshuffleOption);

    std::string message;
    if (!config.isValid(&message)) {
        return fail(error, "Configuration error: " + QString::fromStdString(message));
    }

    options = parsed;
    return true;
}
