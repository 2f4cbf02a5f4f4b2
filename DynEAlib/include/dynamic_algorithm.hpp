//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains the control loop that runs an evolutionary algorithm on a changing problem.

#include <atomic>
#include <mutex>
#include <optional>

#include "archive.hpp"
#include "base.hpp"
#include "dynamic_problem.hpp"
#include "observed_data.hpp"
#include "observer.hpp"
#include "restart.hpp"

/**
 * @brief Raised when the population could not be evaluated or varied.
 *
 * Fatal to a run: the population can no longer be assumed to be valid.
 */
class evaluation_error : public std::exception
{
    std::string message;

  public:
    evaluation_error(const std::string &message) : message(message)
    {
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

enum class RunState
{
    // Prior to, and during, the creation of the initial population.
    INITIALIZING,
    EVOLVING,
    // A change was consumed: a new reference point is passed on to the engine.
    CHANGE_DETECTED,
    // Within a restart strategy.
    RESTARTING,
    // While observers receive a snapshot.
    EMITTING,
    // From requestStop until the current step ends.
    STOPPING_REQUESTED,
    TERMINATED
};

std::string to_string(RunState state);

/**
 * @brief The variation & evaluation machinery wrapped by a DynamicAlgorithm.
 */
class IEvolutionaryEngine : public IDataUser
{
  public:
    // Perform a single generation. The number of individuals must be preserved.
    virtual void advance(std::vector<Individual> &individuals) = 0;
    // (Re-)evaluate the provided individuals on the current version of the problem.
    virtual void evaluate(std::vector<Individual> &individuals) = 0;

    // Reference point of the decision maker, if the engine has any use for it.
    virtual void setReferencePoint(const std::vector<double> & /* reference_point */)
    {
    }

    virtual std::string getName() = 0;
};

/**
 * @brief Runs an evolutionary engine on a dynamic problem.
 *
 * Every step performs a single generation, after which pending changes are handled:
 * - If the problem has changed, the population is restarted using the restart strategy for problem changes.
 * - If a new reference point was received (see receive), the population is restarted using the restart strategy
 *   for parameter changes, and the reference point is passed on to the engine.
 * Once the number of evaluations since the last emission reaches max_iterations, a snapshot of the population
 * is sent to the observers of getObservable(), followed by a restart (using the strategy for problem changes).
 *
 * A DynamicAlgorithm is an observer of reference points: these may be delivered from any thread.
 */
class DynamicAlgorithm : public GenerationalApproach, public IObserver<ObservedValue<std::vector<double>>>
{
    const std::shared_ptr<IEvolutionaryEngine> engine;
    const std::shared_ptr<IDynamicProblem> problem;
    const std::shared_ptr<ISolutionInitializer> initializer;
    std::shared_ptr<RestartStrategy> restart_on_problem_change;
    std::shared_ptr<RestartStrategy> restart_on_parameter_change;
    std::shared_ptr<IArchive> archive;

    const size_t population_size;
    const size_t max_iterations;

    std::vector<Individual> individuals;
    Observable<AlgorithmObservedData> observable;

    std::atomic<RunState> state{RunState::INITIALIZING};
    std::atomic<bool> stop_requested{false};

    std::mutex reference_point_mtx;
    std::optional<std::vector<double>> pending_reference_point;

    // Evaluations since the last emission.
    size_t iterations = 0;
    // Generations performed in total, and at the start of the current period.
    size_t generations = 0;
    size_t completed_iterations = 0;
    size_t evaluations = 0;
    size_t number_of_restarts = 0;

    bool initialized = false;
    void initialize();
    void cycle();

    void evaluate_population();
    void restart(RestartStrategy &strategy, const std::string &reason);
    void emit();
    void update_archive();

    std::optional<std::vector<double>> take_pending_reference_point();

    // Terminate the run, and throw the corresponding fatal error (naming the component that failed).
    void fail_evaluation(const std::string &component, const std::string &cause);
    void fail_restart(const std::string &reason, const std::string &cause);

  public:
    DynamicAlgorithm(std::shared_ptr<Population> population,
                     std::shared_ptr<IEvolutionaryEngine> engine,
                     std::shared_ptr<IDynamicProblem> problem,
                     std::shared_ptr<ISolutionInitializer> initializer,
                     size_t population_size,
                     size_t max_iterations);

    void setPopulation(std::shared_ptr<Population> population) override;
    void registerData() override;
    void afterRegisterData() override;

    // Replacing a strategy is only possible prior to the first step.
    void setRestartStrategy(std::shared_ptr<RestartStrategy> strategy);
    void setRestartStrategyForParameterChange(std::shared_ptr<RestartStrategy> strategy);
    // Archive receiving every evaluated solution, cleared upon a problem change.
    void setArchive(std::shared_ptr<IArchive> archive);

    void step() override;
    void run();
    bool terminated() override;

    // May be called from any thread: the run terminates at the end of the current step.
    void requestStop();

    void receive(const ObservedValue<std::vector<double>> &reference_point) override;

    Observable<AlgorithmObservedData> &getObservable();
    std::vector<Individual> &getSolutionPopulation() override;

    // STOPPING_REQUESTED takes precedence over the phase of the current step.
    RunState getState();
    // Generations completed prior to the current period, as reported in snapshots.
    size_t get_completed_iterations();
    // Evaluations since the last emission.
    size_t get_iterations();
    size_t get_generations();
    size_t get_number_of_restarts();
    std::string getName();
};
