#pragma once

#include <cstdint>
#include <random>

namespace geoshare {

class IRng {
public:
    virtual ~IRng() = default;
    
    virtual double uniform(double min = 0.0, double max = 1.0) = 0;
    virtual int uniformInt(int min, int max) = 0;
    virtual double normal(double mean = 0.0, double stddev = 1.0) = 0;
};

class StandardRng : public IRng {
private:
    std::mt19937 gen_;
    
public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(std::uint32_t seed) : gen_(seed) {}
    
    double uniform(double min = 0.0, double max = 1.0) override {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }
    
    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }
    
    double normal(double mean = 0.0, double stddev = 1.0) override {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(gen_);
    }
};

} // namespace geoshare
