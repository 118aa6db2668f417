#include "slope.h"

namespace Slope {

bool fit(const QVector<QPointF>& samples, int first, int count, double& slope)
{
    if (first < 0 || count < 2 || first + count > samples.size()) return false;

    // Fit y = slope*t + intercept, with t relative to the first sample to
    // keep the sums well conditioned late in long runs
    double t0 = samples[first].x();
    double sumT = 0, sumY = 0, sumTY = 0, sumTT = 0;
    for (int i = first; i < first + count; ++i) {
        double t = samples[i].x() - t0;
        double y = samples[i].y();
        sumT += t;
        sumY += y;
        sumTY += t * y;
        sumTT += t * t;
    }
    double denom = count * sumTT - sumT * sumT;
    if (denom <= 1e-12) return false;

    slope = (count * sumTY - sumT * sumY) / denom;
    return true;
}

bool lastSamples(const QVector<QPointF>& samples, int n, double& slope)
{
    if (n < 2 || samples.size() < n) return false;
    return fit(samples, samples.size() - n, n, slope);
}

bool timeWindow(const QVector<QPointF>& samples, double from, double to, double& slope)
{
    // Samples are time ordered; walk back from the end
    int end = samples.size();
    while (end > 0 && samples[end - 1].x() > to) {
        --end;
    }
    int start = end;
    while (start > 0 && samples[start - 1].x() >= from) {
        --start;
    }
    return fit(samples, start, end - start, slope);
}

} // namespace Slope
