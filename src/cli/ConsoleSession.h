#pragma once

#include <QFile>
#include <QObject>
#include <QTextStream>

#include "../core/playback/PlaybackController.h"

class QSocketNotifier;

// Line-oriented control loop over stdin for a running PlaybackController.
//
//   n next   p previous   <space> pause   + / - volume   < / > seek
//   s leave playlist mode   q quit
class ConsoleSession : public QObject {
    Q_OBJECT

public:
    ConsoleSession(PlaybackController* controller, int seekStepSeconds, int volumeStep,
                   QObject* parent = nullptr);

    void start();
    bool handleCommand(const QString& line);   // false when the session should end

signals:
    void quitRequested();

private slots:
    void onStdinReady();
    void onNowPlayingChanged(bool playlistMode);
    void onStateChanged(PlaybackController::State state);

private:
    void printHelp();

    PlaybackController* m_controller;
    int m_seekStep;
    int m_volumeStep;
    QFile m_stdin;
    QTextStream m_out;
    QSocketNotifier* m_notifier = nullptr;
};
