//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// This file contains producers that push updates to observers from a thread of their own.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <istream>
#include <mutex>
#include <optional>
#include <thread>

#include "base.hpp"
#include "observer.hpp"
#include "problems.hpp"

/**
 * @brief Raised by a source that will never produce a value again.
 *
 * Terminates the thread of that source only.
 */
class source_exhausted : public std::exception
{
    std::string message;

  public:
    source_exhausted(const std::string &message) : message("source exhausted: " + message)
    {
    }

    const char *what() const throw()
    {
        return message.c_str();
    }
};

class IStreamingDataSource
{
  public:
    virtual ~IStreamingDataSource() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void join() = 0;
    virtual bool is_running() = 0;
};

/**
 * @brief A source producing a value every period, on a dedicated thread.
 *
 * Every value produced is stamped with a sequence number and the time of production, and
 * delivered synchronously to all observers of this source (on the thread of this source).
 *
 * Failing to produce a value (any exception other than source_exhausted) is reported, after
 * which the source waits for its next tick. Subclasses should stop and join the source in
 * their destructor, as next_value must not be called on a partially destroyed object.
 */
template <typename Payload> class StreamingDataSource : public IStreamingDataSource
{
    Observable<ObservedValue<Payload>> observable;
    std::chrono::milliseconds period;

    std::optional<std::thread> th;
    std::mutex mtx;
    std::condition_variable cv;
    bool stop_requested = false;
    std::atomic<bool> running{false};
    std::atomic<size_t> sequence{0};

    void loop()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mtx);
                if (period.count() > 0)
                    cv.wait_for(lock, period, [this]() { return stop_requested; });
                if (stop_requested)
                    break;
            }

            try
            {
                tick();
            }
            catch (source_exhausted &e)
            {
                std::cerr << "Streaming source stopped: " << e.what() << std::endl;
                break;
            }
            catch (std::exception &e)
            {
                std::cerr << "Streaming source failed to produce a value: " << e.what() << std::endl;
            }
        }
        running = false;
    }

  protected:
    // The value for this tick, or nothing if there is nothing to report.
    virtual std::optional<Payload> next_value() = 0;

  public:
    StreamingDataSource(std::chrono::milliseconds period) : period(period)
    {
    }
    ~StreamingDataSource()
    {
        stop();
        join();
    }

    Observable<ObservedValue<Payload>> &getObservable()
    {
        return observable;
    }

    /**
     * @brief Produce and publish a single value on the calling thread.
     *
     * Exceptions raised while producing a value propagate to the caller.
     */
    void tick()
    {
        std::optional<Payload> value = next_value();
        if (!value.has_value())
            return;

        ObservedValue<Payload> observed{std::move(*value), sequence++, std::chrono::system_clock::now()};
        observable.setChanged();
        observable.notifyObservers(observed);
    }

    // Number of values published so far.
    size_t get_sequence()
    {
        return sequence;
    }

    void start() override
    {
        t_assert(!th.has_value(), "Source should not be started twice.");
        {
            std::lock_guard<std::mutex> lock(mtx);
            stop_requested = false;
        }
        running = true;
        th = std::thread([this]() { loop(); });
    }

    // Note: a source blocked in next_value (e.g. reading input) stops once that call returns.
    void stop() override
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stop_requested = true;
        }
        cv.notify_all();
    }

    void join() override
    {
        if (th.has_value() && th->joinable())
            th->join();
        th.reset();
    }

    bool is_running() override
    {
        return running;
    }
};

/**
 * @brief Emits 0, 1, 2, ... once every period.
 */
class CounterStreamingDataSource : public StreamingDataSource<int>
{
    int counter = 0;

  protected:
    std::optional<int> next_value() override;

  public:
    CounterStreamingDataSource(std::chrono::milliseconds period);
    ~CounterStreamingDataSource();
};

/**
 * @brief Emits, once every period, a new value for a random edge of a TSP instance.
 */
class StreamingTSPSource : public StreamingDataSource<TSPMatrixData>
{
    size_t num_cities;
    double min_value;
    double max_value;
    Rng rng;

  protected:
    std::optional<TSPMatrixData> next_value() override;

  public:
    StreamingTSPSource(size_t num_cities,
                       std::chrono::milliseconds period,
                       std::optional<size_t> seed = std::nullopt,
                       double min_value = 1.0,
                       double max_value = 1000.0);
    ~StreamingTSPSource();
};

/**
 * @brief Reads whitespace separated vectors of doubles (e.g. reference points) line by line.
 *
 * Reads block: by default there is no period between reads. Empty lines are skipped, lines
 * that cannot be parsed are reported and skipped, and the end of the input exhausts the source.
 */
class StreamingDataSourceFromInput : public StreamingDataSource<std::vector<double>>
{
    std::istream &in;
    std::optional<size_t> dimension;

  protected:
    std::optional<std::vector<double>> next_value() override;

  public:
    StreamingDataSourceFromInput(std::istream &in,
                                 std::optional<size_t> dimension = std::nullopt,
                                 std::chrono::milliseconds period = std::chrono::milliseconds(0));
    ~StreamingDataSourceFromInput();
};
