// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <exception>

namespace medreduce {

// completion policies: how a finished job tells the coordinator it is done

struct local_completion
{
    std::string const operator()(coordinator &coord) const
    {
        return coord.done(0);
    }
};

// calls Done over the rpc channel, as an out of process worker would
class remote_completion
{
  public:
    remote_completion(std::string const &host, unsigned short const port)
      : host_(host), port_(port)
    {
    }

    std::string const operator()(coordinator &/*coord*/) const
    {
        rpc::client client(host_, port_);
        return client.done(0);
    }

  private:
    std::string    host_;
    unsigned short port_;
};

template<typename MapTask,
         typename ReduceTask,
         typename Completion = local_completion>
class job : detail::noncopyable
{
  public:
    typedef MapTask    map_task_type;
    typedef ReduceTask reduce_task_type;
    typedef Completion completion_type;

    job(specification const &spec, coordinator &coord, completion_type const &completion = completion_type())
      : specification_(spec),
        coordinator_(coord),
        completion_(completion)
    {
    }

    size_t const number_of_map_tasks() const
    {
        return specification_.map_tasks;
    }

    size_t const number_of_reduce_tasks() const
    {
        return specification_.reduce_tasks;
    }

    specification const &spec() const
    {
        return specification_;
    }

    template<typename SchedulePolicy>
    void run(results &result)
    {
        SchedulePolicy schedule;
        run(schedule, result);
    }

    // Runs both phases, then reports Done and waits for the coordinator to
    // acknowledge it. The first task failure is rethrown from here; the
    // coordinator is not told the job is done.
    template<typename SchedulePolicy>
    void run(SchedulePolicy &schedule, results &result)
    {
        auto const start_time = std::chrono::system_clock::now();

        validate(specification_);

        // a report left by an earlier run must not pass for the result of this one
        if (!detail::delete_file(specification_.output_filespec)
        &&  boost::filesystem::exists(specification_.output_filespec))
        {
            BOOST_THROW_EXCEPTION(io_error(specification_.output_filespec, "failed to remove previous report"));
        }
        detail::create_directories(specification_.intermediate_directory);

        schedule(*this, result);

        result.completion_reply = completion_(coordinator_);
        coordinator_.wait();

        result.job_runtime = std::chrono::system_clock::now() - start_time;
    }

    // Runs a single map task. Any error is left in 'error' for the schedule
    // policy to act on once every task of the phase has reported.
    bool const run_map_task(size_t const task, results &result, std::exception_ptr &error)
    {
        auto const start_time = std::chrono::system_clock::now();

        try
        {
            ++result.counters.map_tasks_executed;

            typename map_task_type::summary const summary = map_task_type()(specification_, task);
            result.counters.records_processed          += summary.records;
            result.counters.intermediate_files_written += summary.files_written;
            ++result.counters.map_tasks_completed;
        }
        catch (std::exception &e)
        {
            std::cerr << "\nError: map task " << task << ": " << e.what() << "\n";
            ++result.counters.map_task_errors;
            error = std::current_exception();
            return false;
        }
        result.map_times.push_back(std::chrono::system_clock::now() - start_time);

        return true;
    }

    bool const run_reduce_task(size_t const task, results &result, std::exception_ptr &error)
    {
        auto const start_time = std::chrono::system_clock::now();

        try
        {
            ++result.counters.reduce_tasks_executed;

            typename reduce_task_type::summary const summary = reduce_task_type()(specification_, task);
            result.counters.intermediate_files_read += summary.files_read;
            ++result.counters.reduce_tasks_completed;
        }
        catch (std::exception &e)
        {
            std::cerr << "\nError: reduce task " << task << ": " << e.what() << "\n";
            ++result.counters.reduce_task_errors;
            error = std::current_exception();
            return false;
        }
        result.reduce_times.push_back(std::chrono::system_clock::now() - start_time);

        return true;
    }

  private:
    specification const &specification_;
    coordinator         &coordinator_;
    completion_type      completion_;
};

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
