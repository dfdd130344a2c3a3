#pragma once

#include <QString>
#include <QStringList>

namespace recurring {
namespace core {

enum class ErrorKind
{
    None,
    InvalidRule,
    UnsupportedFrequency,
    DisallowedField,
    MissingField,
    NotFound,
    ConflictDetected,
    InvalidArgument,
    StoreFailure,
};

QString errorKindToString(ErrorKind kind);

struct ScheduleError
{
    ErrorKind kind = ErrorKind::None;
    QString message;
    QString field; // offending field for DisallowedField / MissingField
    QStringList allowedFields;

    bool isError() const { return kind != ErrorKind::None; }
    QString toString() const;
};

// Fills *error when given. Always returns false so callers can `return fail(...)`.
bool fail(ScheduleError *error, ErrorKind kind, const QString &message, const QString &field = QString());

} // namespace core
} // namespace recurring
