#pragma once

#include <QByteArray>
#include <QJsonObject>

#include "agenda/core/Error.hpp"
#include "agenda/data/Calendar.hpp"

namespace agenda {
namespace data {

class JsonCodec
{
public:
    static QByteArray toJson(const Calendar &calendar);
    static core::Result<Calendar> fromJson(const QByteArray &json);

private:
    static QJsonObject eventToJson(const Event &event);
    static core::Result<Event> eventFromJson(const QJsonObject &object);
};

} // namespace data
} // namespace agenda
