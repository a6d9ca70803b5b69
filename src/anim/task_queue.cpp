#include <chrono>
#include <glide/task_queue.hpp>
#include <utility>

namespace glide
{

double steady_clock_seconds()
{
    using Seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<Seconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

TaskQueue& TaskQueue::main()
{
    static TaskQueue queue;
    return queue;
}

void TaskQueue::post(Task task)
{
    if (!task)
        return;

    std::lock_guard lock(mutex_);
    tasks_.push_back(std::move(task));
}

size_t TaskQueue::run_pending()
{
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(tasks_);
    }

    size_t ran = 0;
    while (!batch.empty())
    {
        Task task = std::move(batch.front());
        batch.pop_front();
        ++ran;

        try
        {
            task();
        }
        catch (...)
        {
            // Put the unrun remainder back in front of anything posted since
            std::lock_guard lock(mutex_);
            while (!batch.empty())
            {
                tasks_.push_front(std::move(batch.back()));
                batch.pop_back();
            }
            throw;
        }
    }
    return ran;
}

size_t TaskQueue::run_until_idle(size_t max_rounds)
{
    size_t total = 0;
    for (size_t round = 0; round < max_rounds && !empty(); ++round)
    {
        total += run_pending();
    }
    return total;
}

size_t TaskQueue::size() const
{
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

bool TaskQueue::empty() const
{
    std::lock_guard lock(mutex_);
    return tasks_.empty();
}

void TaskQueue::clear()
{
    std::lock_guard lock(mutex_);
    tasks_.clear();
}

Scheduler TaskQueue::scheduler()
{
    return [this](Task task) { post(std::move(task)); };
}

}   // namespace glide
