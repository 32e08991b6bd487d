// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>

namespace medreduce {

namespace schedule_policy {

namespace detail {

// the lowest numbered task's error wins, whatever order the tasks failed in
inline void rethrow_first_error(std::vector<std::exception_ptr> const &errors)
{
    for (auto const &error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }
}

}   // namespace detail


// One thread per task. Each phase ends at a hard barrier: every task of the
// phase is joined before any failure is acted on, and a failed map phase
// never lets the reduce phase start.
template<typename Job>
class cpu_parallel : medreduce::detail::noncopyable
{
  public:
    void operator()(Job &job, results &result)
    {
        map(job, result);
        reduce(job, result);
        result.counters.num_result_files = job.number_of_reduce_tasks();
    }

  private:
    void map(Job &job, results &result)
    {
        // run the Map Tasks
        auto   const start_time = std::chrono::system_clock::now();
        size_t const map_tasks  = job.number_of_map_tasks();

        // one result slot per task, each written only by its own thread
        std::vector<std::exception_ptr> errors(map_tasks);
        {
            medreduce::detail::joined_thread_group map_threads;
            for (size_t task=0; task<map_tasks; ++task)
            {
                auto this_result = std::make_shared<results>();
                all_results_.push_back(this_result);

                map_threads.emplace_back(
                    std::bind(
                        &Job::run_map_task,
                        std::ref(job),
                        task,
                        std::ref(*this_result),
                        std::ref(errors[task])));
            }
            map_threads.join_all();
        }
        result.map_runtime = std::chrono::system_clock::now() - start_time;
        result.counters.actual_map_tasks = map_tasks;

        collate_results(result);
        detail::rethrow_first_error(errors);
    }

    void reduce(Job &job, results &result)
    {
        // run the Reduce Tasks
        auto   const start_time   = std::chrono::system_clock::now();
        size_t const reduce_tasks = job.number_of_reduce_tasks();

        std::vector<std::exception_ptr> errors(reduce_tasks);
        {
            medreduce::detail::joined_thread_group reduce_threads;
            for (size_t task=0; task<reduce_tasks; ++task)
            {
                auto this_result = std::make_shared<results>();
                all_results_.push_back(this_result);

                reduce_threads.emplace_back(
                    std::bind(
                        &Job::run_reduce_task,
                        std::ref(job),
                        task,
                        std::ref(*this_result),
                        std::ref(errors[task])));
            }
            reduce_threads.join_all();
        }
        result.reduce_runtime = std::chrono::system_clock::now() - start_time;
        result.counters.actual_reduce_tasks = reduce_tasks;

        collate_results(result);
        detail::rethrow_first_error(errors);
    }

    void collate_results(results &result)
    {
        // fold the per-task statistics into the job's
        for (auto it=all_results_.cbegin(); it!=all_results_.cend(); ++it)
        {
            result.counters.map_tasks_executed         += (*it)->counters.map_tasks_executed;
            result.counters.map_task_errors            += (*it)->counters.map_task_errors;
            result.counters.map_tasks_completed        += (*it)->counters.map_tasks_completed;
            result.counters.records_processed          += (*it)->counters.records_processed;
            result.counters.intermediate_files_written += (*it)->counters.intermediate_files_written;
            result.counters.reduce_tasks_executed      += (*it)->counters.reduce_tasks_executed;
            result.counters.reduce_task_errors         += (*it)->counters.reduce_task_errors;
            result.counters.reduce_tasks_completed     += (*it)->counters.reduce_tasks_completed;
            result.counters.intermediate_files_read    += (*it)->counters.intermediate_files_read;

            std::copy(
                (*it)->map_times.cbegin(),
                (*it)->map_times.cend(),
                std::back_inserter(result.map_times));
            std::copy(
                (*it)->reduce_times.cbegin(),
                (*it)->reduce_times.cend(),
                std::back_inserter(result.reduce_times));
        }
        all_results_.clear();
    }

  private:
    typedef std::vector<std::shared_ptr<results> > all_results_t;
    all_results_t all_results_;
};

}   // namespace schedule_policy

}   // namespace medreduce

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.
