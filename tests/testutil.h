// testutil.h
#ifndef TESTUTIL_H
#define TESTUTIL_H

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

#include <ostream>

inline void PrintTo(const QString &text, std::ostream *os)
{
    *os << '"' << text.toStdString() << '"';
}

inline QDateTime utc(int year, int month, int day, int hour = 9, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

#endif // TESTUTIL_H
