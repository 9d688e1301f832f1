//----------------------------------------------------------------------------------------------------------------------
// File: Dispatcher.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Dispatcher.hpp"
#include "TaskService.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <future>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Dispatcher::Dispatcher(
    std::shared_ptr<TaskService> const& spTaskService,
    std::uint32_t backgroundThreads,
    std::uint32_t computationThreads)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spTaskService(spTaskService)
    , m_background(backgroundThreads)
    , m_computation(computationThreads)
    , m_storage(boost::asio::make_strand(m_background.get_executor()))
    , m_active(true)
{
    assert(m_logger);
    assert(m_spTaskService);
    m_logger->debug(
        "Started the execution contexts with {} background and {} computation threads.",
        backgroundThreads, computationThreads);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Dispatcher::~Dispatcher()
{
    Shutdown();
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::PostMain(OneShotTask::Callback const& callback)
{
    m_spTaskService->Schedule(callback);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::Post(Context context, Work&& work)
{
    switch (context) {
        case Context::Background: PostBackground(std::move(work)); break;
        case Context::Computation: PostComputation(std::move(work)); break;
        case Context::Storage: PostStorage(std::move(work)); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::PostBackground(Work&& work)
{
    boost::asio::post(m_background, std::move(work));
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::PostComputation(Work&& work)
{
    boost::asio::post(m_computation, std::move(work));
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::PostStorage(Work&& work)
{
    boost::asio::post(m_storage, std::move(work));
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::ExecuteStorage(Work&& work)
{
    if (!m_active) { work(); return; }

    std::packaged_task<void()> task{ std::move(work) };
    auto future = task.get_future();
    boost::asio::post(m_storage, [&task] () { task(); });
    future.get();
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Dispatcher::Shutdown()
{
    if (!m_active) { return; }
    m_active = false;
    m_background.join();
    m_computation.join();
    m_logger->debug("Stopped the execution contexts.");
}

//----------------------------------------------------------------------------------------------------------------------
