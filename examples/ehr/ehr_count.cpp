// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#include <boost/config.hpp>

#if defined(BOOST_MSVC)
#   pragma warning(disable: 4100 4127 4244 4512 4267 4996)
#endif

#include "medreduce.hpp"

#include <algorithm>
#include <iostream>
#include <list>

namespace {

template<typename T>
double const sum(T const &durations)
{
    double sum = 0.0;
    for (auto &chrono : durations)
        sum += chrono.count();
    return sum;
}

void write_stats(medreduce::results const &result)
{
    std::cout << std::endl << "\nMapReduce statistics:";
    std::cout << "\n  MapReduce job runtime                     : " << result.job_runtime.count() << "s of which...";
    std::cout << "\n    Map phase runtime                       : " << result.map_runtime.count() << "s";
    std::cout << "\n    Reduce phase runtime                    : " << result.reduce_runtime.count() << "s";
    std::cout << "\n\n  Map:";
    std::cout << "\n    Total Map tasks                         : " << result.counters.map_tasks_executed;
    std::cout << "\n    Map tasks completed                     : " << result.counters.map_tasks_completed;
    std::cout << "\n    Map task errors                         : " << result.counters.map_task_errors;
    std::cout << "\n    Records processed                       : " << result.counters.records_processed;
    std::cout << "\n    Intermediate files written              : " << result.counters.intermediate_files_written;
    std::cout << "\n    Number of Map Tasks run (in parallel)   : " << result.counters.actual_map_tasks;
    if (result.map_times.size() > 0)
    {
        std::cout << "\n    Fastest Map task ran in                 : " << std::min_element(result.map_times.cbegin(), result.map_times.cend())->count() << "s";
        std::cout << "\n    Slowest Map task ran in                 : " << std::max_element(result.map_times.cbegin(), result.map_times.cend())->count() << "s";
        std::cout << "\n    Average Map task time                   : " << sum(result.map_times) / double(result.map_times.size()) << "s";
    }

    std::cout << "\n\n  Reduce:";
    std::cout << "\n    Total Reduce tasks                      : " << result.counters.reduce_tasks_executed;
    std::cout << "\n    Reduce tasks completed                  : " << result.counters.reduce_tasks_completed;
    std::cout << "\n    Reduce task errors                      : " << result.counters.reduce_task_errors;
    std::cout << "\n    Intermediate files read                 : " << result.counters.intermediate_files_read;
    std::cout << "\n    Number of Reduce Tasks run (in parallel): " << result.counters.actual_reduce_tasks;
    std::cout << "\n    Number of Result Files                  : " << result.counters.num_result_files;
    if (result.reduce_times.size() > 0)
    {
        std::cout << "\n    Fastest Reduce task ran in              : " << std::min_element(result.reduce_times.cbegin(), result.reduce_times.cend())->count() << "s";
        std::cout << "\n    Slowest Reduce task ran in              : " << std::max_element(result.reduce_times.cbegin(), result.reduce_times.cend())->count() << "s";
        std::cout << "\n    Average Reduce task time                : " << sum(result.reduce_times) / double(result.reduce_times.size()) << "s";
    }
    std::cout << std::endl;
}

// the ten most frequent values of one section of the report
void write_frequency_table(char const *heading, medreduce::count_table const &counts)
{
    typedef std::pair<std::string, std::uintmax_t> frequency_t;
    std::list<frequency_t> frequencies(counts.cbegin(), counts.cend());
    frequencies.sort(
        [](frequency_t const &first, frequency_t const &second) {
            return first.second > second.second;
        });

    std::cout << "\n" << heading;
    size_t shown = 0;
    for (auto it=frequencies.cbegin(); it!=frequencies.cend() && shown<10; ++it, ++shown)
        std::cout << "\n    " << it->first << "\t" << it->second;
}

}   // anonymous namespace

int main(int argc, char **argv)
{
    std::cout << "MapReduce Health Record Aggregation";
    if (argc < 2)
    {
        std::cerr << "Usage: ehr_count directory [port] [intermediate_directory] [report_file]\n";
        return 1;
    }

    try
    {
        medreduce::specification spec;
        spec.input_directory = argv[1];

        if (argc > 2)
            spec.coordinator_port = medreduce::parse_port(argv[2]);

        if (argc > 3)
            spec.intermediate_directory = argv[3];

        if (argc > 4)
            spec.output_filespec = argv[4];

        medreduce::discover_partitions(spec);
        medreduce::validate(spec);
        std::cout << "\n" << spec.map_tasks << " input partitions in " << spec.input_directory;

        medreduce::coordinator coordinator(spec);
        medreduce::rpc::server server(coordinator, spec.coordinator_host, spec.coordinator_port);
        std::cout << "\nCoordinator listening on " << spec.coordinator_host << ":" << server.port();

        typedef
        medreduce::job<
            medreduce::map_task,
            medreduce::reduce_task,
            medreduce::remote_completion>
        job_t;

        medreduce::results result;
        job_t job(spec, coordinator, medreduce::remote_completion(spec.coordinator_host, server.port()));
#ifdef _DEBUG
        std::cout << "\nRunning Sequential Health Record MapReduce...";
        job.run<medreduce::schedule_policy::sequential<job_t> >(result);
#else
        std::cout << "\nRunning Parallel Health Record MapReduce...";
        job.run<medreduce::schedule_policy::cpu_parallel<job_t> >(result);
#endif
        std::cout << "\nMapReduce Finished: " << result.completion_reply;

        write_stats(result);

        medreduce::report const totals = medreduce::read_report(spec.output_filespec);
        std::cout << "\nMapReduce results (" << spec.output_filespec << "):";
        write_frequency_table(medreduce::diagnosis_heading, totals.diagnoses);
        write_frequency_table(medreduce::treatment_heading, totals.treatments);
        std::cout << std::endl;
    }
    catch (std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

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
