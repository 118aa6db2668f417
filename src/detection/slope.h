#pragma once

#include <QVector>
#include <QPointF>

namespace Slope {

// Least-squares linear regression over samples[first, first + count).
// Returns false with fewer than two samples or a degenerate time span.
bool fit(const QVector<QPointF>& samples, int first, int count, double& slope);

// Slope of the last n samples
bool lastSamples(const QVector<QPointF>& samples, int n, double& slope);

// Slope of every sample whose time lies in [from, to]
bool timeWindow(const QVector<QPointF>& samples, double from, double to, double& slope);

} // namespace Slope
