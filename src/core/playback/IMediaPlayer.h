#pragma once

#include <QString>

#include "../Result.h"

// Control surface of the external media player.
//
// Every call blocks until the player answers and may fail.  Implementations
// must be callable from the controller thread and the polling thread at
// the same time.
class IMediaPlayer {
public:
    virtual ~IMediaPlayer() = default;

    virtual Result<void> play(const QString& url) = 0;
    virtual Result<void> togglePause() = 0;
    virtual Result<void> seek(int seconds) = 0;          // relative, may be negative
    virtual Result<void> adjustVolume(int delta) = 0;
    virtual Result<void> setLoop(bool enabled) = 0;

    virtual Result<bool> isPlaying() = 0;
    virtual QString duration() = 0;                      // "MM:SS", "00:00" when unknown
    virtual Result<int> currentVolume() = 0;
    virtual Result<double> position() = 0;               // seconds into the track
};
