// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"

BOOST_AUTO_TEST_SUITE(record_parser)

BOOST_AUTO_TEST_CASE(six_fields)
{
    medreduce::record const rec = medreduce::parse_record("1 John Doe 45 flu rest");
    BOOST_CHECK_EQUAL(rec.patient_id, "1");
    BOOST_CHECK_EQUAL(rec.name,       "John Doe");
    BOOST_CHECK_EQUAL(rec.age,        "45");
    BOOST_CHECK_EQUAL(rec.diagnosis,  "flu");
    BOOST_CHECK_EQUAL(rec.treatment,  "rest");
}

BOOST_AUTO_TEST_CASE(runs_of_whitespace)
{
    medreduce::record const rec = medreduce::parse_record("  7\tAnn   Lee 30  cold\t\tfluids  ");
    BOOST_CHECK_EQUAL(rec.patient_id, "7");
    BOOST_CHECK_EQUAL(rec.name,       "Ann Lee");
    BOOST_CHECK_EQUAL(rec.diagnosis,  "cold");
    BOOST_CHECK_EQUAL(rec.treatment,  "fluids");
}

BOOST_AUTO_TEST_CASE(extra_fields_ignored)
{
    medreduce::record const rec = medreduce::parse_record("3 Bob Ray 60 asthma inhaler follow-up 2w");
    BOOST_CHECK_EQUAL(rec.diagnosis, "asthma");
    BOOST_CHECK_EQUAL(rec.treatment, "inhaler");
}

BOOST_AUTO_TEST_CASE(too_few_fields)
{
    try
    {
        medreduce::parse_record("1 John Doe flu");
        BOOST_FAIL("four fields accepted");
    }
    catch (medreduce::malformed_record_error &e)
    {
        BOOST_CHECK_EQUAL(e.tokens(), 4u);
        BOOST_CHECK_EQUAL(e.line(), "1 John Doe flu");
    }
}

BOOST_AUTO_TEST_CASE(blank_line)
{
    BOOST_CHECK_THROW(medreduce::parse_record(""),     medreduce::malformed_record_error);
    BOOST_CHECK_THROW(medreduce::parse_record("  \t"), medreduce::malformed_record_error);
}

BOOST_AUTO_TEST_CASE(same_line_same_record)
{
    std::string const line = "42 Ann Lee 30 migraine rest";
    medreduce::record const first = medreduce::parse_record(line);
    for (int attempt=0; attempt<5; ++attempt)
        BOOST_CHECK(medreduce::parse_record(line) == first);

    // only the separators differ
    BOOST_CHECK(medreduce::parse_record("42\tAnn  Lee 30 migraine   rest")  == first);
    BOOST_CHECK(medreduce::parse_record("   42 Ann Lee 30 migraine rest\t") == first);

    BOOST_CHECK(medreduce::parse_record("42 Ann Lee 31 migraine rest") != first);
    BOOST_CHECK(medreduce::parse_record("43 Ann Lee 30 migraine rest") != first);
}

BOOST_AUTO_TEST_CASE(malformed_is_an_error)
{
    BOOST_CHECK_THROW(medreduce::parse_record("a b c d e"), medreduce::error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(partitions)

BOOST_AUTO_TEST_CASE(sorted_and_filtered)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    spec.output_filespec        = scratch.path("input/reduce-out.txt");
    spec.intermediate_directory = scratch.path("input");

    scratch.write("input/b.txt", "");
    scratch.write("input/a.txt", "");
    scratch.write("input/notes.md", "");
    scratch.write("input/reduce-out.txt", "");
    scratch.write("input/map-diagnosis-a.txt-0.txt", "");
    boost::filesystem::create_directories(scratch.path("input/nested.txt"));

    medreduce::discover_partitions(spec);
    BOOST_REQUIRE_EQUAL(spec.partitions.size(), 2u);
    BOOST_CHECK_EQUAL(spec.map_tasks, 2u);
    BOOST_CHECK_EQUAL(boost::filesystem::path(spec.partitions[0]).filename().string(), "a.txt");
    BOOST_CHECK_EQUAL(boost::filesystem::path(spec.partitions[1]).filename().string(), "b.txt");
}

BOOST_AUTO_TEST_CASE(inputs_named_like_outputs_are_counted)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    boost::filesystem::create_directories(spec.intermediate_directory);

    // the report and intermediates live elsewhere, so these are ordinary inputs
    scratch.write("input/clinic.txt", "1 John Doe 45 flu rest\n");
    scratch.write("input/map-ward.txt", "2 Jane Roe 30 cold fluids\n");
    scratch.write("input/reduce-out.txt", "3 Max Poe 22 flu fluids\n");
    scratch.write("intermediate/map-diagnosis-clinic.txt-0.txt", "flu 1\n");

    medreduce::discover_partitions(spec);
    BOOST_REQUIRE_EQUAL(spec.map_tasks, 3u);
    BOOST_CHECK_EQUAL(boost::filesystem::path(spec.partitions[0]).filename().string(), "clinic.txt");
    BOOST_CHECK_EQUAL(boost::filesystem::path(spec.partitions[1]).filename().string(), "map-ward.txt");
    BOOST_CHECK_EQUAL(boost::filesystem::path(spec.partitions[2]).filename().string(), "reduce-out.txt");
}

BOOST_AUTO_TEST_CASE(missing_directory)
{
    medreduce_test::scratch_directory scratch;
    BOOST_CHECK_THROW(medreduce::make_specification(scratch.path("absent")), medreduce::io_error);
}

BOOST_AUTO_TEST_CASE(validation)
{
    medreduce_test::scratch_directory scratch;
    medreduce::specification spec = medreduce_test::make_spec(scratch);
    scratch.write("input/a.txt", "");
    medreduce::discover_partitions(spec);
    BOOST_CHECK_NO_THROW(medreduce::validate(spec));

    spec.reduce_tasks = 2;
    BOOST_CHECK_THROW(medreduce::validate(spec), medreduce::configuration_error);

    spec.reduce_tasks = 1;
    spec.map_tasks    = 3;
    BOOST_CHECK_THROW(medreduce::validate(spec), medreduce::configuration_error);
}

BOOST_AUTO_TEST_CASE(port_numbers)
{
    BOOST_CHECK_EQUAL(medreduce::parse_port("1234"),  1234u);
    BOOST_CHECK_EQUAL(medreduce::parse_port("0"),     0u);
    BOOST_CHECK_EQUAL(medreduce::parse_port("65535"), 65535u);

    BOOST_CHECK_THROW(medreduce::parse_port("65536"),  medreduce::configuration_error);
    BOOST_CHECK_THROW(medreduce::parse_port("70000"),  medreduce::configuration_error);
    BOOST_CHECK_THROW(medreduce::parse_port("-1"),     medreduce::configuration_error);
    BOOST_CHECK_THROW(medreduce::parse_port(""),       medreduce::configuration_error);
    BOOST_CHECK_THROW(medreduce::parse_port("12ab"),   medreduce::configuration_error);
    BOOST_CHECK_THROW(medreduce::parse_port("123456"), medreduce::configuration_error);
}

BOOST_AUTO_TEST_CASE(line_reader_strips_carriage_returns)
{
    medreduce_test::scratch_directory scratch;
    std::string const filename = scratch.write("crlf.txt", "first\r\nsecond\n");

    medreduce::datasource::line_reader reader(filename);
    std::string line;
    BOOST_REQUIRE(reader.next(line));
    BOOST_CHECK_EQUAL(line, "first");
    BOOST_REQUIRE(reader.next(line));
    BOOST_CHECK_EQUAL(line, "second");
    BOOST_CHECK_EQUAL(reader.line_number(), 2u);
    BOOST_CHECK(!reader.next(line));
}

BOOST_AUTO_TEST_SUITE_END()
