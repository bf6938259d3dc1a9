#include "Result.h"

QString errorCategoryName(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Storage:       return QStringLiteral("Storage");
    case ErrorCategory::Serialization: return QStringLiteral("Serialization");
    case ErrorCategory::NotFound:      return QStringLiteral("NotFound");
    case ErrorCategory::DuplicateName: return QStringLiteral("DuplicateName");
    case ErrorCategory::Player:        return QStringLiteral("Player");
    case ErrorCategory::Concurrency:   return QStringLiteral("Concurrency");
    case ErrorCategory::Unknown:       break;
    }
    return QStringLiteral("Unknown");
}
