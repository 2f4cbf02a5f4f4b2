//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "dynamic_algorithm.hpp"
#include <cmath>
#include <iostream>
#include <sstream>

std::string to_string(RunState state)
{
    switch (state)
    {
    case RunState::INITIALIZING:
        return "INITIALIZING";
    case RunState::EVOLVING:
        return "EVOLVING";
    case RunState::CHANGE_DETECTED:
        return "CHANGE_DETECTED";
    case RunState::RESTARTING:
        return "RESTARTING";
    case RunState::EMITTING:
        return "EMITTING";
    case RunState::STOPPING_REQUESTED:
        return "STOPPING_REQUESTED";
    case RunState::TERMINATED:
        return "TERMINATED";
    }
    return "UNKNOWN";
}

DynamicAlgorithm::DynamicAlgorithm(std::shared_ptr<Population> population,
                                   std::shared_ptr<IEvolutionaryEngine> engine,
                                   std::shared_ptr<IDynamicProblem> problem,
                                   std::shared_ptr<ISolutionInitializer> initializer,
                                   size_t population_size,
                                   size_t max_iterations) :
    engine(engine),
    problem(problem),
    initializer(initializer),
    population_size(population_size),
    max_iterations(max_iterations)
{
    t_assert(population_size > 0, "Population size should be positive.");
    this->population = population;

    // By default, any change results in a fresh population.
    restart_on_problem_change = std::make_shared<RestartStrategy>(
        std::make_shared<RemoveFirstNSolutions>(population_size), std::make_shared<CreateNRandomSolutions>(initializer));
    restart_on_parameter_change = restart_on_problem_change;
}

void DynamicAlgorithm::setPopulation(std::shared_ptr<Population> population)
{
    GenerationalApproach::setPopulation(population);
    problem->setPopulation(population);
    initializer->setPopulation(population);
    engine->setPopulation(population);
    restart_on_problem_change->setPopulation(population);
    restart_on_parameter_change->setPopulation(population);
    if (archive != nullptr)
        archive->setPopulation(population);
}
void DynamicAlgorithm::registerData()
{
    problem->registerData();
    initializer->registerData();
    engine->registerData();
    restart_on_problem_change->registerData();
    restart_on_parameter_change->registerData();
    if (archive != nullptr)
        archive->registerData();
}
void DynamicAlgorithm::afterRegisterData()
{
    problem->afterRegisterData();
    initializer->afterRegisterData();
    engine->afterRegisterData();
    restart_on_problem_change->afterRegisterData();
    restart_on_parameter_change->afterRegisterData();
    if (archive != nullptr)
        archive->afterRegisterData();
}

void DynamicAlgorithm::setRestartStrategy(std::shared_ptr<RestartStrategy> strategy)
{
    t_assert(!initialized, "Restart strategies should be set prior to starting the run.");
    restart_on_problem_change = std::move(strategy);
}
void DynamicAlgorithm::setRestartStrategyForParameterChange(std::shared_ptr<RestartStrategy> strategy)
{
    t_assert(!initialized, "Restart strategies should be set prior to starting the run.");
    restart_on_parameter_change = std::move(strategy);
}
void DynamicAlgorithm::setArchive(std::shared_ptr<IArchive> archive)
{
    t_assert(!initialized, "The archive should be set prior to starting the run.");
    this->archive = std::move(archive);
}

void DynamicAlgorithm::initialize()
{
    state = RunState::INITIALIZING;
    initialized = true;

    setPopulation(population);
    registerData();
    afterRegisterData();

    Population &pop = *population;
    individuals.resize(population_size);
    for (size_t i = 0; i < population_size; ++i)
        individuals[i] = pop.newIndividual();

    try
    {
        initializer->initialize(individuals);
    }
    catch (std::exception &e)
    {
        fail_evaluation("initializer", e.what());
    }
    evaluate_population();
}

void DynamicAlgorithm::evaluate_population()
{
    try
    {
        engine->evaluate(individuals);
    }
    catch (std::exception &e)
    {
        fail_evaluation("engine " + engine->getName() + " (evaluate)", e.what());
    }
    evaluations += individuals.size();
    update_archive();
}

void DynamicAlgorithm::update_archive()
{
    if (archive == nullptr)
        return;
    for (auto ii : individuals)
        archive->try_add(ii);
}

void DynamicAlgorithm::restart(RestartStrategy &strategy, const std::string &reason)
{
    state = RunState::RESTARTING;
    try
    {
        strategy.restart(individuals);
    }
    catch (std::exception &e)
    {
        fail_restart(reason, e.what());
    }
    number_of_restarts++;
}

std::optional<std::vector<double>> DynamicAlgorithm::take_pending_reference_point()
{
    std::lock_guard<std::mutex> lock(reference_point_mtx);
    std::optional<std::vector<double>> reference_point = std::move(pending_reference_point);
    pending_reference_point.reset();
    return reference_point;
}

void DynamicAlgorithm::cycle()
{
    state = RunState::EVOLVING;
    try
    {
        engine->advance(individuals);
    }
    catch (std::exception &e)
    {
        fail_evaluation("engine " + engine->getName() + " (advance)", e.what());
    }
    if (individuals.size() != population_size)
    {
        std::stringstream ss;
        ss << "changed the population size from " << population_size << " to " << individuals.size();
        fail_evaluation("engine " + engine->getName() + " (advance)", ss.str());
    }
    iterations += population_size;
    evaluations += population_size;
    generations++;
    update_archive();

    bool problem_changed = problem->consume_change();
    std::optional<std::vector<double>> reference_point = take_pending_reference_point();
    if (problem_changed || reference_point.has_value())
    {
        state = RunState::CHANGE_DETECTED;
        // The engine learns of the new preferences prior to the restart.
        if (reference_point.has_value())
        {
            try
            {
                engine->setReferencePoint(*reference_point);
            }
            catch (std::exception &e)
            {
                fail_evaluation("engine " + engine->getName() + " (reference point)", e.what());
            }
        }

        if (problem_changed)
            restart(*restart_on_problem_change, "restart upon a change of the problem");
        else
            restart(*restart_on_parameter_change, "restart upon a change of the reference point");

        // Archived objective values no longer reflect the problem.
        if (problem_changed && archive != nullptr)
            archive->clear();

        evaluate_population();
    }

    if (iterations >= max_iterations)
        emit();
}

void DynamicAlgorithm::emit()
{
    state = RunState::EMITTING;
    std::map<std::string, std::string> metadata{
        {"evaluations", std::to_string(evaluations)},
        {"generations", std::to_string(generations)},
        {"restarts", std::to_string(number_of_restarts)},
    };
    AlgorithmObservedData snapshot(std::make_shared<const SubpopulationData>(population->getSubpopulationData(individuals)),
                                   completed_iterations,
                                   getName(),
                                   problem->get_name(),
                                   problem->get_number_of_objectives(),
                                   std::move(metadata));
    observable.setChanged();
    observable.notifyObservers(snapshot);

    restart(*restart_on_problem_change, "periodic restart");
    evaluate_population();
    iterations = 0;
    completed_iterations = generations;
}

void DynamicAlgorithm::fail_evaluation(const std::string &component, const std::string &cause)
{
    state = RunState::TERMINATED;
    std::stringstream ss;
    ss << component << " failed after " << generations << " completed generations: " << cause;
    std::cerr << ss.str() << std::endl;
    throw evaluation_error(ss.str());
}
void DynamicAlgorithm::fail_restart(const std::string &reason, const std::string &cause)
{
    state = RunState::TERMINATED;
    std::stringstream ss;
    ss << reason << " failed after " << generations << " completed generations: " << cause;
    std::cerr << ss.str() << std::endl;
    throw restart_policy_error(ss.str());
}

void DynamicAlgorithm::step()
{
    if (terminated())
        return;
    if (!stop_requested)
    {
        if (!initialized)
            initialize();
        cycle();
    }

    state = stop_requested ? RunState::TERMINATED : RunState::EVOLVING;
}

void DynamicAlgorithm::run()
{
    while (!terminated())
        step();
}

bool DynamicAlgorithm::terminated()
{
    return state == RunState::TERMINATED;
}

void DynamicAlgorithm::requestStop()
{
    stop_requested = true;
}

void DynamicAlgorithm::receive(const ObservedValue<std::vector<double>> &reference_point)
{
    size_t number_of_objectives = problem->get_number_of_objectives();
    if (reference_point.value.size() != number_of_objectives)
    {
        std::stringstream ss;
        ss << "reference point has " << reference_point.value.size() << " dimensions, the problem has "
           << number_of_objectives << " objectives";
        throw malformed_update(ss.str());
    }
    for (size_t o = 0; o < number_of_objectives; ++o)
    {
        if (!std::isfinite(reference_point.value[o]))
        {
            std::stringstream ss;
            ss << "reference point value " << reference_point.value[o] << " for objective " << o
               << " is not finite";
            throw malformed_update(ss.str());
        }
    }
    std::lock_guard<std::mutex> lock(reference_point_mtx);
    pending_reference_point = reference_point.value;
}

Observable<AlgorithmObservedData> &DynamicAlgorithm::getObservable()
{
    return observable;
}
std::vector<Individual> &DynamicAlgorithm::getSolutionPopulation()
{
    return individuals;
}

RunState DynamicAlgorithm::getState()
{
    RunState current = state;
    if (stop_requested && current != RunState::TERMINATED)
        return RunState::STOPPING_REQUESTED;
    return current;
}
size_t DynamicAlgorithm::get_completed_iterations()
{
    return completed_iterations;
}
size_t DynamicAlgorithm::get_iterations()
{
    return iterations;
}
size_t DynamicAlgorithm::get_generations()
{
    return generations;
}
size_t DynamicAlgorithm::get_number_of_restarts()
{
    return number_of_restarts;
}
std::string DynamicAlgorithm::getName()
{
    return "Dynamic " + engine->getName();
}
