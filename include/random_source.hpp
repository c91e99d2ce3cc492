#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <random>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Sequential pseudo-random stream consumed by the search.
 *
 * The search draws in a fixed order, so any implementation that is
 * deterministic for a given construction gives reproducible runs. Tests may
 * substitute scripted streams.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform integer in [0, n). Requires n > 0.
    virtual int uniformIndex(int n) = 0;

    /// Uniform real in [0, 1).
    virtual double uniformReal() = 0;
};


///////////////////////////
///   IMPLEMENTATION    ///
///////////////////////////
/**
 * @brief Default stream backed by std::mt19937_64.
 */
class Mt19937Source : public IRandomSource {
public:
    explicit Mt19937Source(std::uint64_t seed) : engine_(seed) {}

    int uniformIndex(int n) override {
        std::uniform_int_distribution<int> dist(0, n - 1);
        return dist(engine_);
    }

    double uniformReal() override {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine_);
    }

private:
    std::mt19937_64 engine_;
};
