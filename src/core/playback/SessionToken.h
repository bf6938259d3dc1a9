#pragma once

#include <QAtomicInt>
#include <QObject>
#include <QSharedPointer>

// Cancellation flag shared between the controller and one polling task.
// The last owner may sit on another thread, so create() hands out a pointer
// that releases the token through deleteLater on the creating thread.
class SessionToken : public QObject {
    Q_OBJECT

public:
    explicit SessionToken(QObject* parent = nullptr);

    static QSharedPointer<SessionToken> create();

    void cancel();
    bool isCancelled() const;

signals:
    void cancelled();

private:
    QAtomicInt m_cancelled{0};
};
