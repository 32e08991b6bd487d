// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <thread>
#include <boost/config.hpp>

namespace medreduce {
namespace detail {

class noncopyable
{
  protected:
    noncopyable()                               = default;
    ~noncopyable()                              = default;
    noncopyable(noncopyable const &)            = delete;
    noncopyable(noncopyable &&)                 = delete;
    noncopyable &operator=(noncopyable const &) = delete;
    noncopyable &operator=(noncopyable &&)      = delete;
};

class joined_thread_group : public std::vector<std::thread>
{
  public:
    ~joined_thread_group()
    {
        join_all();
    }

    void join_all()
    {
        for (auto &thread : *this)
        {
            if (thread.joinable())
                thread.join();
        }
    }
};


}   // namespace detail
}   // namespace medreduce

namespace medreduce {

// value -> number of records carrying it
typedef std::map<std::string, std::uintmax_t> count_table;

struct specification
{
    std::string              input_directory;        // directory path to scan for input partitions
    std::string              input_extension;        // extension an input partition must carry
    std::vector<std::string> partitions;             // ordered input partitions, one per map task
    size_t                   map_tasks;              // number of map tasks, always partitions.size()
    size_t                   reduce_tasks;           // number of reduce tasks
    std::string              intermediate_directory; // where map tasks leave their count tables
    std::string              output_filespec;        // filespec of the final report
    std::string              coordinator_host;       // address the coordinator listens and is dialled on
    unsigned short           coordinator_port;       // 0 lets the system choose

    specification()
      : input_directory("."),
        input_extension(".txt"),
        map_tasks(0),
        reduce_tasks(1),
        intermediate_directory("intermediate"),
        output_filespec("reduce-out.txt"),
        coordinator_host("127.0.0.1"),
        coordinator_port(1234)
    {
    }
};

struct results
{
    struct tag_counters
    {
        size_t actual_map_tasks;        // number of map tasks actually launched
        size_t actual_reduce_tasks;     // number of reduce tasks actually launched

        // counters for map task processing
        size_t map_tasks_executed;
        size_t map_task_errors;
        size_t map_tasks_completed;
        size_t records_processed;
        size_t intermediate_files_written;

        // counters for reduce task processing
        size_t reduce_tasks_executed;
        size_t reduce_task_errors;
        size_t reduce_tasks_completed;
        size_t intermediate_files_read;

        size_t num_result_files;        // number of report files created

        tag_counters()
          : actual_map_tasks(0),
            actual_reduce_tasks(0),
            map_tasks_executed(0),
            map_task_errors(0),
            map_tasks_completed(0),
            records_processed(0),
            intermediate_files_written(0),
            reduce_tasks_executed(0),
            reduce_task_errors(0),
            reduce_tasks_completed(0),
            intermediate_files_read(0),
            num_result_files(0)
        {
        }
    } counters;

    std::string                                completion_reply;    // acknowledgement returned by Done

    std::chrono::duration<double>              job_runtime;
    std::chrono::duration<double>              map_runtime;
    std::chrono::duration<double>              reduce_runtime;
    std::vector<std::chrono::duration<double>> map_times;
    std::vector<std::chrono::duration<double>> reduce_times;
};

}   // namespace medreduce

#include <boost/throw_exception.hpp>
#include "detail/errors.hpp"
#include "detail/platform.hpp"
#include "detail/record.hpp"
#include "detail/datasource.hpp"
#include "detail/intermediates.hpp"
#include "detail/specification.hpp"
#include "detail/map_task.hpp"
#include "detail/reduce_task.hpp"
#include "detail/task_pool.hpp"
#include "detail/completion_gate.hpp"
#include "detail/coordinator.hpp"
#include "detail/rpc.hpp"
#include "detail/job.hpp"
#include "detail/schedule_policy.hpp"

namespace medreduce {

template<typename Job>
void run(medreduce::specification const &spec, medreduce::coordinator &coordinator, medreduce::results &result)
{
    Job job(spec, coordinator);
    job.template run<medreduce::schedule_policy::cpu_parallel<Job> >(result);
}

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
