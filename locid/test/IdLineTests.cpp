// Test recognizing "- id: L<N>" lines.

#include "../id_line.hpp"

#include "IdLineTests.hpp"

// Register the fixture to be run.
CPPUNIT_TEST_SUITE_REGISTRATION( IdLineTests );

void IdLineTests::testPlainIdentifier() {
    IdLine line("- id: L7");
    CPPUNIT_ASSERT(line.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 7, line.get_number());
    
    IdLine zero("- id: L0");
    CPPUNIT_ASSERT(zero.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 0, zero.get_number());
}

/**
 * Only the leading run of digits counts; whatever follows it is ignored.
 */
void IdLineTests::testTrailingCharacters() {
    IdLine crlf("- id: L12\r");
    CPPUNIT_ASSERT(crlf.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 12, crlf.get_number());
    
    IdLine comment("- id: L42  # Old town hall");
    CPPUNIT_ASSERT(comment.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 42, comment.get_number());
    
    IdLine letters("- id: L9abc");
    CPPUNIT_ASSERT(letters.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 9, letters.get_number());
}

void IdLineTests::testLeadingZeros() {
    IdLine line("- id: L007");
    CPPUNIT_ASSERT(line.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 7, line.get_number());
}

void IdLineTests::testWrongPrefix() {
    CPPUNIT_ASSERT(!IdLine("- id: M3").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- id: l3").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- name: L3").is_identifier());
    CPPUNIT_ASSERT(!IdLine("id: L5").is_identifier());
    CPPUNIT_ASSERT(!IdLine("-id: L5").is_identifier());
    CPPUNIT_ASSERT(!IdLine("").is_identifier());
    CPPUNIT_ASSERT(!IdLine().is_identifier());
}

void IdLineTests::testNoDigits() {
    CPPUNIT_ASSERT(!IdLine("- id: L").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- id: Lx12").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- id: L 12").is_identifier());
}

/**
 * The prefix has to sit at the very start of the line.
 */
void IdLineTests::testNotAtLineStart() {
    CPPUNIT_ASSERT(!IdLine("  - id: L5").is_identifier());
    CPPUNIT_ASSERT(!IdLine("\t- id: L5").is_identifier());
    CPPUNIT_ASSERT(!IdLine("parents: - id: L5").is_identifier());
}

void IdLineTests::testOverflow() {
    IdLine biggest("- id: L18446744073709551614");
    CPPUNIT_ASSERT(biggest.is_identifier());
    CPPUNIT_ASSERT_EQUAL((IdNum) 18446744073709551614ULL, biggest.get_number());
    
    // No successor exists for the largest 64-bit value
    CPPUNIT_ASSERT(!IdLine("- id: L18446744073709551615").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- id: L18446744073709551616").is_identifier());
    CPPUNIT_ASSERT(!IdLine("- id: L99999999999999999999999").is_identifier());
}
