// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"

#include <limits>

BOOST_AUTO_TEST_SUITE(intermediate_store)

BOOST_AUTO_TEST_CASE(filename_layout)
{
    std::string const filename =
        medreduce::intermediates::intermediate_filename(
            "work", "/data/ehr/clinic-a.txt", 3, medreduce::intermediates::treatment_category);
    BOOST_CHECK_EQUAL(
        filename,
        (boost::filesystem::path("work") / "map-treatment-clinic-a.txt-3.txt").string());
    BOOST_CHECK(medreduce::intermediates::is_intermediate_filename("map-treatment-clinic-a.txt-3.txt"));
    BOOST_CHECK(!medreduce::intermediates::is_intermediate_filename("clinic-a.txt"));
}

BOOST_AUTO_TEST_CASE(one_line_per_value)
{
    medreduce_test::scratch_directory scratch;
    medreduce::count_table counts;
    counts["flu"]  = 2;
    counts["cold"] = 1;

    std::string const filename = scratch.path("counts.txt");
    medreduce::intermediates::write_counts(filename, counts);
    BOOST_CHECK_EQUAL(medreduce_test::read_file(filename), "cold 1\nflu 2\n");
}

BOOST_AUTO_TEST_CASE(read_accumulates)
{
    medreduce_test::scratch_directory scratch;
    std::string const first  = scratch.write("first.txt",  "flu 2\ncold 1\n");
    std::string const second = scratch.write("second.txt", "flu 1\nmigraine 4\n");

    medreduce::count_table counts;
    BOOST_CHECK_EQUAL(medreduce::intermediates::read_counts(first,  counts), 2u);
    BOOST_CHECK_EQUAL(medreduce::intermediates::read_counts(second, counts), 2u);
    BOOST_CHECK_EQUAL(counts.size(), 3u);
    BOOST_CHECK_EQUAL(counts["flu"],      3u);
    BOOST_CHECK_EQUAL(counts["cold"],     1u);
    BOOST_CHECK_EQUAL(counts["migraine"], 4u);
}

BOOST_AUTO_TEST_CASE(counts_read_back_as_written)
{
    medreduce_test::scratch_directory scratch;
    medreduce::count_table written;
    written["flu"]             = 1;
    written["covid-19"]        = 1234567890123u;
    written["type-2-diabetes"] = 42;
    written["b12"]             = std::numeric_limits<std::uintmax_t>::max();

    std::string const filename = scratch.path("counts.txt");
    medreduce::intermediates::write_counts(filename, written);

    medreduce::count_table read;
    BOOST_CHECK_EQUAL(medreduce::intermediates::read_counts(filename, read), written.size());
    BOOST_CHECK(read == written);
}

BOOST_AUTO_TEST_CASE(overflowing_total)
{
    medreduce_test::scratch_directory scratch;
    std::string const largest = std::to_string(std::numeric_limits<std::uintmax_t>::max());
    std::string const first   = scratch.write("first.txt",  "flu " + largest + "\n");
    std::string const second  = scratch.write("second.txt", "cold 1\nflu 1\n");

    medreduce::count_table counts;
    BOOST_CHECK_EQUAL(medreduce::intermediates::read_counts(first, counts), 1u);
    BOOST_CHECK_THROW(medreduce::intermediates::read_counts(second, counts), medreduce::io_error);
    BOOST_CHECK_EQUAL(counts["flu"], std::numeric_limits<std::uintmax_t>::max());

    medreduce::count_table totals;
    BOOST_CHECK(medreduce::intermediates::accumulate(totals, "flu", 2));
    BOOST_CHECK(medreduce::intermediates::accumulate(totals, "flu", std::numeric_limits<std::uintmax_t>::max() - 2));
    BOOST_CHECK(!medreduce::intermediates::accumulate(totals, "flu", 1));
    BOOST_CHECK_EQUAL(totals["flu"], std::numeric_limits<std::uintmax_t>::max());
}

BOOST_AUTO_TEST_CASE(empty_table)
{
    medreduce_test::scratch_directory scratch;
    std::string const filename = scratch.path("empty.txt");
    medreduce::intermediates::write_counts(filename, medreduce::count_table());
    BOOST_CHECK(scratch.exists("empty.txt"));

    medreduce::count_table counts;
    BOOST_CHECK_EQUAL(medreduce::intermediates::read_counts(filename, counts), 0u);
    BOOST_CHECK(counts.empty());
}

BOOST_AUTO_TEST_CASE(missing_file)
{
    medreduce_test::scratch_directory scratch;
    medreduce::count_table counts;
    BOOST_CHECK_THROW(
        medreduce::intermediates::read_counts(scratch.path("absent.txt"), counts),
        medreduce::io_error);
}

BOOST_AUTO_TEST_CASE(malformed_lines)
{
    medreduce_test::scratch_directory scratch;
    medreduce::count_table counts;
    BOOST_CHECK_THROW(
        medreduce::intermediates::read_counts(scratch.write("a.txt", "flu\n"), counts),
        medreduce::io_error);
    BOOST_CHECK_THROW(
        medreduce::intermediates::read_counts(scratch.write("b.txt", "flu two\n"), counts),
        medreduce::io_error);
    BOOST_CHECK_THROW(
        medreduce::intermediates::read_counts(scratch.write("c.txt", "flu 1 extra\n"), counts),
        medreduce::io_error);
    BOOST_CHECK_THROW(
        medreduce::intermediates::read_counts(scratch.write("d.txt", "flu -1\n"), counts),
        medreduce::io_error);
}

BOOST_AUTO_TEST_CASE(no_temporary_left_behind)
{
    medreduce_test::scratch_directory scratch;
    medreduce::count_table counts;
    counts["flu"] = 1;
    medreduce::intermediates::write_counts(scratch.path("counts.txt"), counts);

    size_t files = 0;
    for (boost::filesystem::directory_iterator it(scratch.path()); it!=boost::filesystem::directory_iterator(); ++it)
        ++files;
    BOOST_CHECK_EQUAL(files, 1u);
}

BOOST_AUTO_TEST_CASE(uncommitted_file_discarded)
{
    medreduce_test::scratch_directory scratch;
    {
        medreduce::detail::committed_file file(scratch.path("report.txt"));
        file.stream() << "partial";
    }
    BOOST_CHECK(!scratch.exists("report.txt"));
    BOOST_CHECK(boost::filesystem::is_empty(scratch.path()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(map_and_reduce)

BOOST_AUTO_TEST_CASE(map_task_writes_both_tables)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    scratch.write("input/a.txt", "1 John Doe 45 flu rest\n2 Jane Roe 30 cold fluids\n3 Max Poe 22 flu fluids\n");
    medreduce::discover_partitions(spec);
    boost::filesystem::create_directories(spec.intermediate_directory);

    medreduce::map_task::summary const summary = medreduce::map_task()(spec, 0);
    BOOST_CHECK_EQUAL(summary.records,       3u);
    BOOST_CHECK_EQUAL(summary.diagnoses,     2u);
    BOOST_CHECK_EQUAL(summary.treatments,    2u);
    BOOST_CHECK_EQUAL(summary.files_written, 2u);

    medreduce::intermediates::local_disk const store(spec);
    BOOST_CHECK_EQUAL(
        medreduce_test::read_file(store.filename(0, medreduce::intermediates::diagnosis_category)),
        "cold 1\nflu 2\n");
    BOOST_CHECK_EQUAL(
        medreduce_test::read_file(store.filename(0, medreduce::intermediates::treatment_category)),
        "fluids 2\nrest 1\n");
}

BOOST_AUTO_TEST_CASE(map_task_reports_source_line)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    scratch.write("input/a.txt", "1 John Doe 45 flu rest\n2 Jane Roe cold\n");
    medreduce::discover_partitions(spec);
    boost::filesystem::create_directories(spec.intermediate_directory);

    try
    {
        medreduce::map_task()(spec, 0);
        BOOST_FAIL("malformed record accepted");
    }
    catch (medreduce::malformed_record_error &e)
    {
        BOOST_CHECK_EQUAL(e.line_number(), 2u);
        BOOST_CHECK_EQUAL(e.tokens(), 4u);
        BOOST_CHECK_EQUAL(e.source(), spec.partitions[0]);
    }

    medreduce::intermediates::local_disk const store(spec);
    BOOST_CHECK(!boost::filesystem::exists(store.filename(0, medreduce::intermediates::diagnosis_category)));
}

BOOST_AUTO_TEST_CASE(reduce_merges_every_partition)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    scratch.write("input/a.txt", "1 John Doe 45 flu rest\n");
    scratch.write("input/b.txt", "2 Jane Roe 30 flu fluids\n3 Max Poe 22 cold rest\n");
    medreduce::discover_partitions(spec);
    boost::filesystem::create_directories(spec.intermediate_directory);

    medreduce::map_task()(spec, 0);
    medreduce::map_task()(spec, 1);
    medreduce::reduce_task::summary const summary = medreduce::reduce_task()(spec, 0);
    BOOST_CHECK_EQUAL(summary.files_read, 4u);

    BOOST_CHECK_EQUAL(
        medreduce_test::read_file(spec.output_filespec),
        "Diagnosis Counts:\ncold 1\nflu 2\nTreatment Counts:\nfluids 1\nrest 2\n");

    medreduce::report const totals = medreduce::read_report(spec.output_filespec);
    BOOST_CHECK_EQUAL(totals.diagnoses.at("flu"),  2u);
    BOOST_CHECK_EQUAL(totals.treatments.at("rest"), 2u);
}

BOOST_AUTO_TEST_CASE(report_rejects_bad_counts)
{
    medreduce_test::scratch_directory scratch;
    std::string const largest = std::to_string(std::numeric_limits<std::uintmax_t>::max());

    BOOST_CHECK_THROW(
        medreduce::read_report(scratch.write("negative.txt", "Diagnosis Counts:\nflu -1\n")),
        medreduce::io_error);
    BOOST_CHECK_THROW(
        medreduce::read_report(scratch.write("overflow.txt", "Diagnosis Counts:\nflu " + largest + "\nflu 1\n")),
        medreduce::io_error);
}

BOOST_AUTO_TEST_CASE(reduce_fails_on_missing_intermediate)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    scratch.write("input/a.txt", "1 John Doe 45 flu rest\n");
    scratch.write("input/b.txt", "2 Jane Roe 30 cold fluids\n");
    medreduce::discover_partitions(spec);
    boost::filesystem::create_directories(spec.intermediate_directory);

    medreduce::map_task()(spec, 0);
    medreduce::map_task()(spec, 1);

    medreduce::intermediates::local_disk const store(spec);
    boost::filesystem::remove(store.filename(1, medreduce::intermediates::treatment_category));

    try
    {
        medreduce::reduce_task()(spec, 0);
        BOOST_FAIL("reduce succeeded without every intermediate");
    }
    catch (medreduce::io_error &e)
    {
        BOOST_CHECK_EQUAL(e.path(), store.filename(1, medreduce::intermediates::treatment_category));
    }
    BOOST_CHECK(!boost::filesystem::exists(spec.output_filespec));
}

BOOST_AUTO_TEST_SUITE_END()
