#include "measurementstore.h"
#include <QDebug>

QString seriesToString(Series series)
{
    switch (series) {
        case Series::Conductance:         return "conductance";
        case Series::Resistance:          return "resistance";
        case Series::GasConcentration:    return "co2";
        case Series::AmbientTemperature:  return "ambient_temperature";
        case Series::Humidity:            return "humidity";
        case Series::MeasuredTemperature: return "measured_temperature";
        case Series::HeaterSetpoint:      return "heater_setpoint";
    }
    return "unknown";
}

Regen::Channel channelForSeries(Series series)
{
    switch (series) {
        case Series::Conductance:
        case Series::Resistance:
            return Regen::Channel::Conductance;
        case Series::GasConcentration:
        case Series::AmbientTemperature:
        case Series::Humidity:
            return Regen::Channel::Gas;
        case Series::MeasuredTemperature:
        case Series::HeaterSetpoint:
            return Regen::Channel::Heater;
    }
    return Regen::Channel::Conductance;
}

MeasurementStore::MeasurementStore()
{
    for (auto& s : m_series) {
        s.reserve(4096);
    }
}

bool MeasurementStore::append(Series series, double time, double value)
{
    QVector<QPointF>& target = m_series[index(series)];
    if (!target.isEmpty() && time < target.last().x()) {
        qWarning() << "[Store] Dropping out-of-order" << seriesToString(series)
                   << "sample at" << time << "(last" << target.last().x() << ")";
        return false;
    }
    target.append(QPointF(time, value));
    return true;
}

QPointF MeasurementStore::last(Series series) const
{
    const QVector<QPointF>& s = m_series[index(series)];
    return s.isEmpty() ? QPointF() : s.last();
}

void MeasurementStore::clearChannel(Regen::Channel channel)
{
    for (int i = 0; i < SeriesCount; ++i) {
        if (channelForSeries(static_cast<Series>(i)) == channel) {
            m_series[i].clear();
        }
    }
}

void MeasurementStore::clear()
{
    for (auto& s : m_series) {
        s.clear();
    }
}
