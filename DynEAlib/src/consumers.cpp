//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "consumers.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

#include <cereal/archives/json.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

LocalDirectoryOutputConsumer::LocalDirectoryOutputConsumer(std::filesystem::path directory) :
    directory(std::move(directory))
{
    std::filesystem::create_directories(this->directory);
}

void LocalDirectoryOutputConsumer::receive(const AlgorithmObservedData &data)
{
    std::lock_guard<std::mutex> lock(mtx);
    size_t k = num_written;
    auto &objectives = data.get_objectives();

    std::filesystem::path fun_path = directory / ("FUN" + std::to_string(k) + ".csv");
    std::ofstream fun(fun_path);
    t_assert(fun.good(), "Objective file should be writable.");
    fun << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (auto &o : objectives)
    {
        for (size_t idx = 0; idx < o.objectives.size(); ++idx)
        {
            if (idx != 0)
                fun << ",";
            fun << o.objectives[idx];
        }
        fun << "\n";
    }
    fun.close();

    std::filesystem::path snapshot_path = directory / ("snapshot" + std::to_string(k) + ".json");
    std::ofstream snapshot(snapshot_path);
    t_assert(snapshot.good(), "Snapshot file should be writable.");
    {
        // The archive completes the document upon destruction.
        cereal::JSONOutputArchive ar(snapshot);
        ar(cereal::make_nvp("algorithm", data.get_algorithm_name()),
           cereal::make_nvp("problem", data.get_problem_name()),
           cereal::make_nvp("number_of_objectives", data.get_number_of_objectives()),
           cereal::make_nvp("completed_iterations", data.get_completed_iterations()),
           cereal::make_nvp("metadata", data.get_metadata()),
           cereal::make_nvp("objectives", objectives));
    }
    snapshot.close();

    num_written++;
}

size_t LocalDirectoryOutputConsumer::get_number_of_snapshots_written()
{
    std::lock_guard<std::mutex> lock(mtx);
    return num_written;
}
