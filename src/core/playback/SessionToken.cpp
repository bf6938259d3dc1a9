#include "SessionToken.h"

SessionToken::SessionToken(QObject* parent)
    : QObject(parent)
{
}

QSharedPointer<SessionToken> SessionToken::create()
{
    return QSharedPointer<SessionToken>(new SessionToken, &QObject::deleteLater);
}

void SessionToken::cancel()
{
    if (!m_cancelled.testAndSetOrdered(0, 1))
        return;
    emit cancelled();
}

bool SessionToken::isCancelled() const
{
    return m_cancelled.loadAcquire() != 0;
}
