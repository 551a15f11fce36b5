#include <QCoreApplication>
#include <QDebug>
#include <QTimer>
#include "TrainerCommandLine.h"
#include "TrainingLoop.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("PoleChainTrainer");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("PoleChain");

    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    if (!commandLine.parse(app.arguments(), options, &error)) {
        qCritical().noquote() << error;
        return 1;
    }
    if (commandLine.helpRequested()) commandLine.showHelp();
    if (commandLine.versionRequested()) commandLine.showVersion();

    TrainingLoop loop(options.config);

    const int maxEpisodes = options.maxEpisodes;
    if (maxEpisodes > 0) {
        QObject::connect(&loop, &TrainingLoop::episodeFinished, &app,
                         [&loop, &app, maxEpisodes](int episode, int, double) {
            if (episode >= maxEpisodes) {
                loop.stop();
                qInfo() << "Best episode:" << loop.session().bestEpisodeSteps() << "steps";
                app.quit();
            }
        });
    }

    QTimer::singleShot(0, &loop, &TrainingLoop::start);
    return app.exec();
}
