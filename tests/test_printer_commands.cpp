#include <catch2/catch.hpp>
#include "print/printer_commands.h"

using namespace llink;

TEST_CASE("PrinterCommands: darkness levels", "[printer_commands]")
{
    SECTION("supported level renders a setvar line")
    {
        auto command = PrinterCommands::darkness(50);
        REQUIRE(command.isSuccess());
        REQUIRE(command.value() == "! U1 setvar \"print.tone\" \"50\"\n");
    }

    SECTION("negative levels are supported")
    {
        REQUIRE(PrinterCommands::isValidDarkness(-99));
        REQUIRE(PrinterCommands::darkness(-25).isSuccess());
    }

    SECTION("unsupported level is rejected")
    {
        auto command = PrinterCommands::darkness(42);
        REQUIRE_FALSE(command.isSuccess());
        REQUIRE(command.code == LLINK_ERROR_CODE::INVALID_PARAMETER);
        REQUIRE(command.message == "Unsupported darkness level: 42");
    }
}

TEST_CASE("PrinterCommands: media type templates", "[printer_commands]")
{
    REQUIRE(PrinterCommands::mediaType(MediaType::LABEL) ==
            "! U1 setvar \"media.type\" \"label\"\n! U1 setvar \"media.sense_mode\" \"gap\"\n");
    REQUIRE(PrinterCommands::mediaType(MediaType::BLACK_MARK) ==
            "! U1 setvar \"media.type\" \"label\"\n! U1 setvar \"media.sense_mode\" \"bar\"\n");
    REQUIRE(PrinterCommands::mediaType(MediaType::JOURNAL) == "! U1 setvar \"media.type\" \"journal\"\n");
    REQUIRE(PrinterCommands::calibrate() == "~jc^xa^jus^xz");
}

TEST_CASE("PrinterCommands: orientation", "[printer_commands]")
{
    SECTION("normal orientation is inserted after the format start")
    {
        REQUIRE(PrinterCommands::applyOrientation("^XA^FDHello^XZ", false) == "^XA^PON^FDHello^XZ");
    }

    SECTION("rotation swaps to inverted")
    {
        REQUIRE(PrinterCommands::applyOrientation("^XA^FDHello^XZ", true) == "^XA^POI^FDHello^XZ");
    }

    SECTION("explicit orientation is kept")
    {
        REQUIRE(PrinterCommands::applyOrientation("^XA^PON^FDHi^XZ", false) == "^XA^PON^FDHi^XZ");
        REQUIRE(PrinterCommands::applyOrientation("^XA^PON^FDHi^XZ", true) == "^XA^POI^FDHi^XZ");
    }

    SECTION("every label in a batch is handled")
    {
        REQUIRE(PrinterCommands::applyOrientation("^XA^FD1^XZ^XA^FD2^XZ", true) == "^XA^POI^FD1^XZ^XA^POI^FD2^XZ");
    }

    SECTION("payload without a format start passes through")
    {
        REQUIRE(PrinterCommands::applyOrientation("plain text", true) == "plain text");
    }
}

TEST_CASE("PrinterCommands: cut sequence", "[printer_commands]")
{
    const std::string cut = PrinterCommands::cutSequence();
    REQUIRE(cut.size() == 5);
    REQUIRE(cut == std::string("\x0a\x0a\x1d\x56\x01", 5));
}
