//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains observers for the snapshots emitted by a DynamicAlgorithm.

#include <filesystem>
#include <functional>
#include <mutex>

#include "observed_data.hpp"
#include "observer.hpp"

/**
 * @brief Writes every snapshot received to a directory.
 *
 * For the k-th snapshot (starting at 0) two files are written:
 * - FUN<k>.csv, the objective values, one solution per line.
 * - snapshot<k>.json, the metadata and objective values of the snapshot.
 */
class LocalDirectoryOutputConsumer : public IObserver<AlgorithmObservedData>
{
    std::filesystem::path directory;
    std::mutex mtx;
    size_t num_written = 0;

  public:
    LocalDirectoryOutputConsumer(std::filesystem::path directory);

    void receive(const AlgorithmObservedData &data) override;

    size_t get_number_of_snapshots_written();
};

class FunctionDataConsumer : public IObserver<AlgorithmObservedData>
{
    std::function<void(const AlgorithmObservedData &)> f;

  public:
    FunctionDataConsumer(std::function<void(const AlgorithmObservedData &)> f) : f(std::move(f))
    {
    }

    void receive(const AlgorithmObservedData &data) override
    {
        f(data);
    }
};
