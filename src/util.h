// -*- mode: c++ -*-

#ifndef UTIL_H
#define UTIL_H

#include <chrono>

// Measures the wall time between construction and destruction, and
// adds it (in seconds) to the given counter.
//
//   double search_s = 0;
//   {
//       MeasureTime<> timer(&search_s);
//       ...
//   }
template<class Clock = std::chrono::steady_clock>
class MeasureTime {
public:
    explicit MeasureTime(double* counter)
        : counter_(counter),
          start_(Clock::now()) {
    }

    ~MeasureTime() {
        std::chrono::duration<double> elapsed = Clock::now() - start_;
        *counter_ += elapsed.count();
    }

private:
    MeasureTime(const MeasureTime& other) = delete;
    MeasureTime& operator=(const MeasureTime& other) = delete;

    double* counter_;
    typename Clock::time_point start_;
};

#endif
