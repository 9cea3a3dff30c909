#include <boost/test/unit_test.hpp>

#include "datatreefixture.h"

#include "../errors.h"

#include "../telescopes/alignmentmatrix.h"

#include <sstream>

BOOST_AUTO_TEST_SUITE(alignment_matrix)

BOOST_AUTO_TEST_CASE( parse )
{
	std::istringstream stream(
		"# p q up\n"
		"-0.1195950000 -0.7919540000 0.5987530000\n"
		" 0.9928230000 -0.0954190000 0.0720990000\n"
		" 0.0000330000  0.6030780000 0.7976820000\n");
	AlignmentMatrix matrix = AlignmentMatrix::Parse(stream, "test.txt");
	BOOST_CHECK_EQUAL(matrix.Rows(), 3);
	BOOST_CHECK_EQUAL(matrix.Columns(), 3);
	BOOST_CHECK(!matrix.Empty());
	BOOST_CHECK_CLOSE(matrix(0, 0), -0.119595, 1e-9);
	BOOST_CHECK_CLOSE(matrix(0, 2), 0.598753, 1e-9);
	BOOST_CHECK_CLOSE(matrix(1, 0), 0.992823, 1e-9);
	BOOST_CHECK_CLOSE(matrix(2, 1), 0.603078, 1e-9);
	BOOST_CHECK_EQUAL(matrix.Values().size(), 9);
}

BOOST_AUTO_TEST_CASE( non_square )
{
	std::istringstream stream("1 2\n3 4\n5 6\n");
	AlignmentMatrix matrix = AlignmentMatrix::Parse(stream, "test.txt");
	BOOST_CHECK_EQUAL(matrix.Rows(), 3);
	BOOST_CHECK_EQUAL(matrix.Columns(), 2);
	BOOST_CHECK_EQUAL(matrix(2, 1), 6.0);
}

BOOST_AUTO_TEST_CASE( malformed )
{
	std::istringstream ragged("1 2 3\n4 5\n");
	BOOST_CHECK_THROW(AlignmentMatrix::Parse(ragged, "test.txt"), MalformedError);
	std::istringstream notANumber("1 2 x\n");
	BOOST_CHECK_THROW(AlignmentMatrix::Parse(notANumber, "test.txt"), MalformedError);
	std::istringstream empty("# nothing\n");
	BOOST_CHECK_THROW(AlignmentMatrix::Parse(empty, "test.txt"), MalformedError);
}

BOOST_FIXTURE_TEST_CASE( read_from_data_root, DataTreeFixture )
{
	WriteAlignment("TEST", "ST001", "LBA", identityAlignment);
	AlignmentMatrix matrix = AlignmentMatrix::Read(Root(), "TEST", "ST001", "LBA");
	BOOST_CHECK_EQUAL(matrix.Rows(), 3);
	BOOST_CHECK_EQUAL(matrix(1, 1), 1.0);
	BOOST_CHECK_EQUAL(matrix(1, 2), 0.0);
	BOOST_CHECK_THROW(AlignmentMatrix::Read(Root(), "TEST", "ST002", "LBA"), NotFoundError);
}

BOOST_AUTO_TEST_SUITE_END()
