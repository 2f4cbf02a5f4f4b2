//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "utilities.hpp"

class Population;

/**
 * @brief Handle to a solution stored in a Population.
 *
 * An individual is only an index, all associated data lives in the data containers
 * of the population that created it.
 */
struct Individual
{
    size_t i = 0;
    const Population *creator = nullptr;

    bool operator==(const Individual &o) const
    {
        return i == o.i && creator == o.creator;
    }
    bool operator!=(const Individual &o) const
    {
        return !(*this == o);
    }
};

// Standalone (i.e. detached from any population) copy of the data of a set of individuals.
class ISubDataContainer
{
  public:
    virtual ~ISubDataContainer() = default;

    virtual std::type_index type() const = 0;
    virtual size_t size() const = 0;
};

template <typename T> class SubDataContainer : public ISubDataContainer
{
  public:
    std::vector<T> data;

    SubDataContainer(std::vector<T> data) : data(std::move(data))
    {
    }

    std::type_index type() const override
    {
        return typeid(T);
    }
    size_t size() const override
    {
        return data.size();
    }
};

class IDataContainer
{
  public:
    virtual ~IDataContainer() = default;

    virtual void resize(size_t size) = 0;
    virtual void copy(size_t from, size_t to) = 0;
    virtual void reset(size_t idx) = 0;
    virtual std::shared_ptr<ISubDataContainer> extract(const std::vector<Individual> &iis) const = 0;
};

template <typename T> class DataContainer : public IDataContainer
{
    // A deque does not invalidate references upon growing at the end: references obtained
    // through getData stay valid when new individuals are created.
    std::deque<T> data;

  public:
    void resize(size_t size) override
    {
        data.resize(size);
    }
    void copy(size_t from, size_t to) override
    {
        if (from == to)
            return;
        data[to] = data[from];
    }
    void reset(size_t idx) override
    {
        data[idx] = T();
    }
    std::shared_ptr<ISubDataContainer> extract(const std::vector<Individual> &iis) const override
    {
        std::vector<T> copied;
        copied.reserve(iis.size());
        for (auto &ii : iis)
            copied.push_back(data[ii.i]);
        return std::make_shared<SubDataContainer<T>>(std::move(copied));
    }

    T &get(size_t idx)
    {
        return data[idx];
    }
};

/**
 * @brief Cached accessor for a particular kind of data.
 *
 * Avoids the type lookup of Population::getData in tight loops.
 */
template <typename T> class TypedGetter
{
    DataContainer<T> *container;

  public:
    TypedGetter(DataContainer<T> *container) : container(container)
    {
    }

    T &getData(const Individual &ii)
    {
        return container->get(ii.i);
    }
};

/**
 * @brief The data of a subset of individuals, copied out of a population.
 *
 * Shares no memory with the population it was taken from, and provides no means of
 * modification: subsequent changes to the population are not reflected here.
 */
class SubpopulationData
{
    size_t num = 0;
    std::vector<std::shared_ptr<const ISubDataContainer>> containers;

  public:
    SubpopulationData() = default;
    SubpopulationData(size_t num, std::vector<std::shared_ptr<const ISubDataContainer>> containers);

    size_t size() const
    {
        return num;
    }

    template <typename T> bool contains() const
    {
        for (auto &c : containers)
            if (c->type() == std::type_index(typeid(T)))
                return true;
        return false;
    }

    template <typename T> const std::vector<T> &get() const
    {
        for (auto &c : containers)
        {
            if (c->type() == std::type_index(typeid(T)))
                return static_cast<const SubDataContainer<T> &>(*c).data;
        }
        throw std::out_of_range("requested data was not registered when the subpopulation was copied");
    }
};

class Population
{
    std::vector<std::type_index> registration_order;
    std::unordered_map<std::type_index, std::unique_ptr<IDataContainer>> containers;
    std::unordered_map<std::type_index, std::shared_ptr<void>> global_data;

    // Slot bookkeeping: dropped slots are reused before new ones are allocated.
    std::vector<char> in_use;
    std::vector<size_t> reuse;
    size_t num_active = 0;

  public:
    template <typename T> void registerData()
    {
        std::type_index t = typeid(T);
        if (containers.find(t) != containers.end())
            return;
        auto container = std::make_unique<DataContainer<T>>();
        container->resize(in_use.size());
        containers.emplace(t, std::move(container));
        registration_order.push_back(t);
    }

    template <typename T> bool isRegistered() const
    {
        return containers.find(typeid(T)) != containers.end();
    }

    template <typename T> TypedGetter<T> getDataContainer()
    {
        auto it = containers.find(typeid(T));
        t_assert(it != containers.end(), "Data should be registered before it can be accessed.");
        return TypedGetter<T>(static_cast<DataContainer<T> *>(it->second.get()));
    }

    template <typename T> T &getData(const Individual &ii)
    {
        t_assert(ii.creator == this, "Individual should belong to this population.");
        return getDataContainer<T>().getData(ii);
    }

    template <typename T> void registerGlobalData(T data)
    {
        global_data[typeid(T)] = std::make_shared<T>(std::move(data));
    }

    template <typename T> bool isGlobalRegistered() const
    {
        return global_data.find(typeid(T)) != global_data.end();
    }

    template <typename T> std::shared_ptr<T> getGlobalData()
    {
        auto it = global_data.find(typeid(T));
        t_assert(it != global_data.end(), "Global data should be registered before it can be accessed.");
        return std::static_pointer_cast<T>(it->second);
    }

    Individual newIndividual();
    void dropIndividual(Individual ii);
    void copyIndividual(Individual from, Individual to);

    // Number of slots allocated.
    size_t capacity() const;
    // Number of slots currently occupied by an individual.
    size_t active() const;

    SubpopulationData getSubpopulationData(const std::vector<Individual> &iis) const;
};

/**
 * @brief Component that stores data in, or requires data from, a population.
 *
 * Setup happens in three phases: setPopulation, registerData (register anything this
 * component provides) and afterRegisterData (check that what is required is present).
 */
class IDataUser
{
  protected:
    std::shared_ptr<Population> population;

  public:
    virtual ~IDataUser() = default;

    virtual void setPopulation(std::shared_ptr<Population> population)
    {
        this->population = population;
    }
    virtual void registerData()
    {
    }
    virtual void afterRegisterData()
    {
    }
};

// Data types

struct Objective
{
    // Note: lower is better.
    std::vector<double> objectives;

    template <class Archive> void serialize(Archive &ar)
    {
        ar(objectives);
    }
};

struct GenotypeContinuous
{
    std::vector<double> genotype;
};

struct GenotypeContinuousData
{
    size_t l;
    std::vector<double> lower;
    std::vector<double> upper;
};

struct GenotypePermutation
{
    std::vector<size_t> genotype;
};

struct GenotypePermutationData
{
    size_t l;
};

struct Rng
{
    std::mt19937 rng;

    Rng(std::optional<size_t> seed = std::nullopt)
    {
        if (seed.has_value())
            rng.seed(static_cast<std::mt19937::result_type>(*seed));
        else
            rng.seed(std::random_device()());
    }
};

// Interfaces

class ObjectiveFunction : public IDataUser
{
  public:
    virtual void evaluate(Individual i) = 0;
};

class ISolutionInitializer : public IDataUser
{
  public:
    virtual void initialize(std::vector<Individual> &iis) = 0;
};

/**
 * @brief Three-way comparison of solutions.
 *
 * Returns 1 if a is better, 2 if b is better, 3 if equal and 0 if incomparable.
 */
class IPerformanceCriterion : public IDataUser
{
  public:
    virtual short compare(Individual &a, Individual &b) = 0;
};

class GenerationalApproach : public IDataUser
{
  public:
    virtual void step() = 0;
    virtual bool terminated()
    {
        return false;
    }
    virtual std::vector<Individual> &getSolutionPopulation() = 0;
};
