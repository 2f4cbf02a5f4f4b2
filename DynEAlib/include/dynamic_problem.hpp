//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <mutex>
#include <string>

#include "base.hpp"
#include "observer.hpp"

/**
 * @brief Raised when an update does not fit the problem it is applied to.
 *
 * The update is discarded: the problem retains its prior state.
 */
class malformed_update : public std::exception
{
    std::string message;

  public:
    malformed_update(const std::string &message) : message("malformed update: " + message)
    {
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

/**
 * @brief Edge-triggered "modified" flag.
 *
 * Any number of changes between two calls to consume_change collapse into a single
 * pending change. The flag is guarded by a mutex, as it is set by whichever thread
 * delivers an update, and consumed by the thread running the algorithm.
 */
class ChangeTracker
{
    mutable std::mutex flag_mtx;
    bool modified = false;

  protected:
    void mark_changed();

  public:
    virtual ~ChangeTracker() = default;

    // Query only, does not clear the flag.
    bool has_changed() const;

    // Atomically read and clear the flag, returns the value prior to clearing.
    bool consume_change();
};

class IDynamicProblem : public ObjectiveFunction, public ChangeTracker
{
  public:
    virtual std::string get_name() = 0;
    virtual size_t get_number_of_objectives() = 0;
    virtual size_t get_number_of_variables() = 0;
};

/**
 * @brief A problem whose parameters are updated by values of type Payload.
 *
 * Updates and evaluations are mutually exclusive: an update is never applied while a
 * solution is being evaluated. Subclasses should take `mtx` within evaluate.
 */
template <typename Payload> class DynamicProblem : public IDynamicProblem, public IObserver<ObservedValue<Payload>>
{
  protected:
    std::mutex mtx;

    // Throw malformed_update if the payload does not match the shape of this problem.
    // Must not modify any state.
    virtual void validate(const Payload &payload) = 0;
    virtual void update(const Payload &payload) = 0;

  public:
    void apply(const Payload &payload)
    {
        std::lock_guard<std::mutex> lock(mtx);
        validate(payload);
        update(payload);
        mark_changed();
    }

    void receive(const ObservedValue<Payload> &data) override
    {
        apply(data.value);
    }
};
