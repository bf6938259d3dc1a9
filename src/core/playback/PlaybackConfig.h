#pragma once

#include <QString>

// Polling cadences and thresholds for the player watchers.
struct PlaybackConfig {
    int positionPollMs          = 500;
    int endOfTrackPollMs        = 1000;
    int endOfTrackIdleThreshold = 3;
    int confirmInitialDelayMs   = 1000;
    int confirmPollMs           = 1000;
    int confirmIdleBudget       = 10;
    int listeningPollMs         = 1000;

    QString mediaUrlTemplate = QStringLiteral("https://www.youtube.com/watch?v=%1");

    QString mediaUrlFor(const QString& trackId) const { return mediaUrlTemplate.arg(trackId); }

    static PlaybackConfig fromSettings();
};
