//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "streaming.hpp"
#include <random>
#include <sstream>
#include <stdexcept>

// CounterStreamingDataSource
CounterStreamingDataSource::CounterStreamingDataSource(std::chrono::milliseconds period) :
    StreamingDataSource<int>(period)
{
}
CounterStreamingDataSource::~CounterStreamingDataSource()
{
    stop();
    join();
}
std::optional<int> CounterStreamingDataSource::next_value()
{
    return counter++;
}

// StreamingTSPSource
StreamingTSPSource::StreamingTSPSource(
    size_t num_cities, std::chrono::milliseconds period, std::optional<size_t> seed, double min_value, double max_value) :
    StreamingDataSource<TSPMatrixData>(period),
    num_cities(num_cities),
    min_value(min_value),
    max_value(max_value),
    rng(seed)
{
    t_assert(num_cities > 1, "An instance requires at least two cities to have an edge.");
    t_assert(min_value >= 0.0 && min_value <= max_value, "Value range should be non-negative and non-empty.");
}
StreamingTSPSource::~StreamingTSPSource()
{
    stop();
    join();
}
std::optional<TSPMatrixData> StreamingTSPSource::next_value()
{
    std::uniform_int_distribution<size_t> city(0, num_cities - 1);
    std::uniform_int_distribution<int> matrix(0, 1);
    std::uniform_real_distribution<double> value(min_value, max_value);

    size_t x = city(rng.rng);
    size_t y = city(rng.rng);
    while (y == x)
        y = city(rng.rng);

    return TSPMatrixData{matrix(rng.rng) == 0 ? TSPMatrix::DISTANCE : TSPMatrix::COST, x, y, value(rng.rng)};
}

// StreamingDataSourceFromInput
StreamingDataSourceFromInput::StreamingDataSourceFromInput(std::istream &in,
                                                           std::optional<size_t> dimension,
                                                           std::chrono::milliseconds period) :
    StreamingDataSource<std::vector<double>>(period), in(in), dimension(dimension)
{
}
StreamingDataSourceFromInput::~StreamingDataSourceFromInput()
{
    stop();
    join();
}
std::optional<std::vector<double>> StreamingDataSourceFromInput::next_value()
{
    std::string line;
    if (!std::getline(in, line))
        throw source_exhausted("end of input");

    std::stringstream ss(line);
    std::vector<double> values;
    double v;
    while (ss >> v)
        values.push_back(v);
    if (!ss.eof())
        throw std::invalid_argument("could not parse '" + line + "' as a list of numbers");
    if (values.empty())
        return std::nullopt;

    if (dimension.has_value() && values.size() != *dimension)
    {
        std::stringstream err;
        err << "expected " << *dimension << " values, got " << values.size();
        throw std::invalid_argument(err.str());
    }
    return values;
}
