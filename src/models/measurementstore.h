#pragma once

#include <QVector>
#include <QPointF>
#include <QString>

#include "../core/regenconstants.h"

// One physical quantity recorded by the bench. x = channel time (s), y = value.
enum class Series {
    Conductance,          // µS
    Resistance,           // Ω
    GasConcentration,     // ppm
    AmbientTemperature,   // °C
    Humidity,             // %
    MeasuredTemperature,  // °C, heating element
    HeaterSetpoint        // °C
};

QString seriesToString(Series series);
Regen::Channel channelForSeries(Series series);

// Append-only per-series sample storage owned by the engine.
// Snapshots are implicitly shared QVector copies, so readers never see
// a partially appended sample.
class MeasurementStore {
public:
    MeasurementStore();

    // Rejects a sample older than the last one of the same series.
    bool append(Series series, double time, double value);

    const QVector<QPointF>& series(Series series) const { return m_series[index(series)]; }
    QVector<QPointF> snapshot(Series series) const { return m_series[index(series)]; }

    int size(Series series) const { return m_series[index(series)].size(); }
    bool isEmpty(Series series) const { return m_series[index(series)].isEmpty(); }
    QPointF last(Series series) const;

    // Clears every series fed by the channel
    void clearChannel(Regen::Channel channel);
    void clear();

    static constexpr int SeriesCount = 7;

private:
    static int index(Series series) { return static_cast<int>(series); }

    QVector<QPointF> m_series[SeriesCount];
};
