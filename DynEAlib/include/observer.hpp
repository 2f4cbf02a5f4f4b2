//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
//
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
//
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains the publish/subscribe primitive connecting producers of data
// (streaming sources, the algorithm itself) to the components interested in it.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

class subscriber_delivery_error : public std::exception
{
    std::string message;

  public:
    subscriber_delivery_error(size_t position, const std::string &cause)
    {
        std::stringstream ss;
        ss << "delivery to subscriber #" << position << " failed: " << cause;
        message = ss.str();
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

template <typename T> class IObserver
{
  public:
    virtual ~IObserver() = default;

    virtual void receive(const T &data) = 0;
};

/**
 * @brief A value as emitted by a producer, tagged with when it was produced.
 *
 * Sequence numbers are assigned per producer, and increase by one for every emitted value.
 */
template <typename T> struct ObservedValue
{
    T value;
    size_t sequence = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Synchronous fan-out of values to a list of observers.
 *
 * notifyObservers calls each observer directly on the calling thread, in registration order.
 * The observer list is copied under a lock before delivery, so (de)registering from another
 * thread is safe and only affects subsequent notifications.
 *
 * An observer that throws does not stop delivery to the others: the failure is reported on
 * std::cerr and delivery continues with the next observer.
 */
template <typename T> class Observable
{
    mutable std::mutex mtx;
    std::vector<std::shared_ptr<IObserver<T>>> observers;
    std::atomic<bool> changed{false};

  public:
    // Registering an observer that is already registered has no effect.
    void register_observer(std::shared_ptr<IObserver<T>> observer)
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (std::find(observers.begin(), observers.end(), observer) != observers.end())
            return;
        observers.push_back(std::move(observer));
    }

    void deregister_observer(const std::shared_ptr<IObserver<T>> &observer)
    {
        std::lock_guard<std::mutex> lock(mtx);
        observers.erase(std::remove(observers.begin(), observers.end(), observer), observers.end());
    }

    size_t count_observers() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return observers.size();
    }

    void setChanged()
    {
        changed = true;
    }
    bool hasChanged() const
    {
        return changed;
    }
    void clearChanged()
    {
        changed = false;
    }

    /**
     * @brief Deliver data to all currently registered observers.
     *
     * @param data the value to deliver, passed by reference to every observer.
     * @return size_t the number of observers whose delivery failed.
     */
    size_t notifyObservers(const T &data)
    {
        std::vector<std::shared_ptr<IObserver<T>>> current;
        {
            std::lock_guard<std::mutex> lock(mtx);
            current = observers;
        }

        size_t num_failed = 0;
        for (size_t idx = 0; idx < current.size(); ++idx)
        {
            try
            {
                current[idx]->receive(data);
            }
            catch (std::exception &e)
            {
                num_failed++;
                std::cerr << subscriber_delivery_error(idx, e.what()).what() << std::endl;
            }
            catch (...)
            {
                // Not derived from std::exception: still must not take down the producer.
                num_failed++;
                std::cerr << subscriber_delivery_error(idx, "unknown exception").what() << std::endl;
            }
        }
        clearChanged();
        return num_failed;
    }
};
