// src/tree/finder/ExhaustiveSplitFinder.cpp - OpenMP并行版本
#include "finder/ExhaustiveSplitFinder.hpp"
#include <algorithm>
#include <vector>
#include <tuple>
#ifdef _OPENMP
#include <omp.h>
#endif

std::tuple<int, double, double>
ExhaustiveSplitFinder::findBestSplit(const std::vector<double>& data,
                                     int                        rowLength,
                                     const std::vector<double>& labels,
                                     const std::vector<int>&    indices,
                                     int                        minSamplesLeaf) const
{
    const size_t N = indices.size();
    const size_t minLeaf = static_cast<size_t>(std::max(1, minSamplesLeaf));
    if (N < 2 * minLeaf) return {-1, 0.0, 0.0};

    /* ---------- 父节点统计量 ---------- */
    double totalSum   = 0.0;
    double totalSumSq = 0.0;
    for (size_t i = 0; i < N; ++i) {
        const double y = labels[indices[i]];
        totalSum   += y;
        totalSumSq += y * y;
    }
    const double parentMean = totalSum / static_cast<double>(N);
    const double parentMSE  = totalSumSq / static_cast<double>(N) - parentMean * parentMean;

    int    bestFeat = -1;
    double bestThr  = 0.0;
    double bestGain = 0.0;
    constexpr double EPS = 1e-12;

    /* ---------- 特征间并行搜索 ---------- */
    #pragma omp parallel
    {
        int    localFeat = -1;
        double localThr  = 0.0;
        double localGain = 0.0;
        std::vector<int> sortedIdx(N);

        #pragma omp for schedule(dynamic) nowait
        for (int f = 0; f < rowLength; ++f) {
            std::copy(indices.begin(), indices.end(), sortedIdx.begin());
            std::sort(sortedIdx.begin(), sortedIdx.end(),
                      [&](int a, int b) {
                          return data[a * rowLength + f] < data[b * rowLength + f];
                      });

            double leftSum   = 0.0;
            double leftSumSq = 0.0;

            for (size_t i = 0; i + 1 < N; ++i) {
                const int    idx = sortedIdx[i];
                const double y   = labels[idx];
                leftSum   += y;
                leftSumSq += y * y;

                const size_t leftCnt  = i + 1;
                const size_t rightCnt = N - leftCnt;
                if (leftCnt < minLeaf || rightCnt < minLeaf) continue;

                const double currentVal = data[idx * rowLength + f];
                const double nextVal    = data[sortedIdx[i + 1] * rowLength + f];
                if (!(currentVal + EPS < nextVal)) continue;

                const double rightSum   = totalSum   - leftSum;
                const double rightSumSq = totalSumSq - leftSumSq;
                const double leftMean   = leftSum  / static_cast<double>(leftCnt);
                const double rightMean  = rightSum / static_cast<double>(rightCnt);
                const double leftMSE    = leftSumSq  / static_cast<double>(leftCnt)  - leftMean  * leftMean;
                const double rightMSE   = rightSumSq / static_cast<double>(rightCnt) - rightMean * rightMean;

                const double gain = parentMSE -
                    (leftMSE * static_cast<double>(leftCnt) +
                     rightMSE * static_cast<double>(rightCnt)) / static_cast<double>(N);

                if (gain > localGain) {
                    localGain = gain;
                    localFeat = f;
                    localThr  = 0.5 * (currentVal + nextVal);
                }
            }
        }

        /* --- 线程间归约，增益相同时取较小特征下标保证结果确定 --- */
        #pragma omp critical
        {
            if (localGain > bestGain ||
                (localGain == bestGain && localFeat >= 0 && (bestFeat < 0 || localFeat < bestFeat))) {
                bestGain = localGain;
                bestFeat = localFeat;
                bestThr  = localThr;
            }
        }
    }

    return {bestFeat, bestThr, bestGain};
}
