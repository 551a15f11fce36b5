#ifndef TRAINERCOMMANDLINE_H
#define TRAINERCOMMANDLINE_H

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>
#include "TrainingConfig.h"

struct TrainerOptions {
    TrainingConfig config;
    int maxEpisodes = 0;           // 0 = run until stopped
};

/**
 * @brief Command-line options of the trainer
 *
 * parse() fills TrainerOptions from the arguments (program name first) and
 * validates the resulting configuration. --help and --version are reported
 * through helpRequested()/versionRequested() so the caller decides to exit.
 */
class TrainerCommandLine {
public:
    TrainerCommandLine();

    // Returns false with a message in error on unknown options, malformed
    // numbers or an invalid configuration
    bool parse(const QStringList& arguments, TrainerOptions& options, QString* error = nullptr);

    bool helpRequested() const { return m_parser.isSet(m_helpOption); }
    bool versionRequested() const { return m_parser.isSet(m_versionOption); }

    // Both print and exit the process
    void showHelp() { m_parser.showHelp(0); }
    void showVersion() { m_parser.showVersion(); }

private:
    bool readInt(const QCommandLineOption& option, int& out, QString* error) const;
    bool readDouble(const QCommandLineOption& option, double& out, QString* error) const;
    bool readSeed(std::uint32_t& out, QString* error) const;

    QCommandLineParser m_parser;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_polesOption;
    QCommandLineOption m_seedOption;
    QCommandLineOption m_tickOption;
    QCommandLineOption m_timeScaleOption;
    QCommandLineOption m_gravityOption;
    QCommandLineOption m_maxEpisodesOption;
    QCommandLineOption m_syncOption;
    QCommandLineOption m_normalizeOption;
    QCommandLineOption m_reshuffleOption;
};

#endif // TRAINERCOMMANDLINE_H
