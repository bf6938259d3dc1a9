#include "PlaybackConfig.h"
#include "../Settings.h"

#include <QtGlobal>

PlaybackConfig PlaybackConfig::fromSettings()
{
    auto* s = Settings::instance();

    PlaybackConfig c;
    c.positionPollMs          = qMax(10, s->positionPollMs());
    c.endOfTrackPollMs        = qMax(10, s->endOfTrackPollMs());
    c.endOfTrackIdleThreshold = qMax(1, s->endOfTrackIdleThreshold());
    c.confirmInitialDelayMs   = qMax(0, s->confirmInitialDelayMs());
    c.confirmPollMs           = qMax(10, s->confirmPollMs());
    c.confirmIdleBudget       = qMax(1, s->confirmIdleBudget());
    c.listeningPollMs         = qMax(10, s->listeningPollMs());
    c.mediaUrlTemplate        = s->mediaUrlTemplate();
    return c;
}
