//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.hpp
// Description: Provides the execution contexts used by the library. The main context is the core thread's task 
// service, blocking network work runs on the background pool, and session construction runs on the computation 
// pool. Durable storage writes run on a strand of the background pool so they complete in the order they were posted.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Cancelable.hpp"
#include "Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class TaskService;
class Dispatcher;

enum class Context : std::uint32_t { Background, Computation, Storage };

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Dispatcher
{
public:
    using Work = std::function<void()>;

    Dispatcher(
        std::shared_ptr<TaskService> const& spTaskService,
        std::uint32_t backgroundThreads,
        std::uint32_t computationThreads);
    ~Dispatcher();

    Dispatcher(Dispatcher const&) = delete;
    Dispatcher& operator=(Dispatcher const&) = delete;

    void PostMain(OneShotTask::Callback const& callback);
    void Post(Context context, Work&& work);
    void PostBackground(Work&& work);
    void PostComputation(Work&& work);
    void PostStorage(Work&& work);

    // Runs the work on the storage strand and blocks until it has completed. Work posted to the strand beforehand 
    // completes first. Once the dispatcher has been shutdown the work is run on the calling thread. 
    void ExecuteStorage(Work&& work);

    // Runs the work on the provided context and delivers its result on the main context. When the returned handle is
    // cancelled the callback will not be invoked. Work that has not started by the time of cancellation is skipped.
    template<typename ResultType>
    [[nodiscard]] std::shared_ptr<Cancelable> Launch(
        Context context, std::function<ResultType()> work, std::function<void(ResultType&&)> callback);

    // Stops accepting work and waits for the pools to finish their outstanding tasks. 
    void Shutdown();

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<TaskService> m_spTaskService;
    boost::asio::thread_pool m_background;
    boost::asio::thread_pool m_computation;
    boost::asio::strand<boost::asio::thread_pool::executor_type> m_storage;
    bool m_active;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename ResultType>
std::shared_ptr<Scheduler::Cancelable> Scheduler::Dispatcher::Launch(
    Context context, std::function<ResultType()> work, std::function<void(ResultType&&)> callback)
{
    auto spCancelable = std::make_shared<Cancelable>();
    Post(context, [this, spCancelable, work = std::move(work), callback = std::move(callback)] () {
        if (spCancelable->IsCancelled()) { return; }
        auto spResult = std::make_shared<std::optional<ResultType>>(work());
        PostMain([spCancelable, spResult, callback] () {
            if (spCancelable->IsCancelled()) { return; }
            callback(std::move(**spResult));
        });
    });
    return spCancelable;
}

//----------------------------------------------------------------------------------------------------------------------
