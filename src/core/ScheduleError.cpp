#include "recurring/core/ScheduleError.hpp"

namespace recurring {
namespace core {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidRule:
        return QStringLiteral("InvalidRule");
    case ErrorKind::UnsupportedFrequency:
        return QStringLiteral("UnsupportedFrequency");
    case ErrorKind::DisallowedField:
        return QStringLiteral("DisallowedField");
    case ErrorKind::MissingField:
        return QStringLiteral("MissingField");
    case ErrorKind::NotFound:
        return QStringLiteral("NotFound");
    case ErrorKind::ConflictDetected:
        return QStringLiteral("ConflictDetected");
    case ErrorKind::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case ErrorKind::StoreFailure:
        return QStringLiteral("StoreFailure");
    case ErrorKind::None:
    default:
        return QStringLiteral("None");
    }
}

QString ScheduleError::toString() const
{
    if (!isError()) {
        return {};
    }
    return QStringLiteral("%1: %2").arg(errorKindToString(kind), message);
}

bool fail(ScheduleError *error, ErrorKind kind, const QString &message, const QString &field)
{
    if (error) {
        error->kind = kind;
        error->message = message;
        error->field = field;
        error->allowedFields.clear();
    }
    return false;
}

} // namespace core
} // namespace recurring
