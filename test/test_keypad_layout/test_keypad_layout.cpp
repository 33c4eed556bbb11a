#include <unity.h>
#include <keypad_layout.hpp>
#include <keypad_config.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

void setUp(void) {
}

void tearDown(void) {
}

void test_phoneLayout_shouldMatchTelephoneKeypad(void) {
    const char* expected[4] = {"123", "456", "789", "*0#"};

    for (uint8_t r = 0; r < 4; r++) {
        for (uint8_t c = 0; c < 3; c++) {
            TEST_ASSERT_EQUAL_INT_MESSAGE(expected[r][c], keypad::PHONE_LAYOUT.at(r, c), "Unexpected phone key");
        }
    }
    TEST_ASSERT_TRUE_MESSAGE(keypad::PHONE_LAYOUT.isValid(), "Phone layout should be valid");
}

void test_isValid_duplicateKey_shouldFail(void) {
    const keypad::KeypadLayout<2, 2>::Table keys = {{
        {{'A', 'B'}},
        {{'C', 'A'}}
    }};
    const keypad::KeypadLayout<2, 2> layout(keys);

    TEST_ASSERT_FALSE_MESSAGE(layout.isValid(), "Duplicated 'A' should make the layout invalid");
}

void test_isValid_noKeyCharacter_shouldFail(void) {
    const keypad::KeypadLayout<1, 3>::Table keys = {{ {{'A', keypad::NO_KEY, 'C'}} }};
    const keypad::KeypadLayout<1, 3> layout(keys);

    TEST_ASSERT_FALSE_MESSAGE(layout.isValid(), "A blank key cannot be told apart from no key");
}

void test_singleRowLayout_shouldBuildFromTable(void) {
    const keypad::KeypadLayout<1, 4>::Table keys = {{ {{'<', '>', 'O', 'K'}} }};
    const keypad::KeypadLayout<1, 4> layout(keys);
    const keypad::KeypadLayout<1, 1>::Table singleKey = {{ {{'X'}} }};
    const keypad::KeypadLayout<1, 1> button(singleKey);

    TEST_ASSERT_TRUE_MESSAGE(layout.isValid(), "Row of four distinct keys should be valid");
    TEST_ASSERT_EQUAL_INT_MESSAGE('<', layout.at(0, 0), "First key");
    TEST_ASSERT_EQUAL_INT_MESSAGE('K', layout.at(0, 3), "Last key");
    TEST_ASSERT_TRUE_MESSAGE(button.isValid(), "Single key should be valid");
    TEST_ASSERT_EQUAL_INT_MESSAGE('X', button.at(0, 0), "Only key");
}

void test_fromStrings_matchingDimensions_shouldBuildLayout(void) {
    const keypad::KeypadLayout<2, 4>::Table blank = {{ {{'0', '0', '0', '0'}}, {{'0', '0', '0', '0'}} }};
    keypad::KeypadLayout<2, 4> layout(blank);

    bool ok = keypad::KeypadLayout<2, 4>::fromStrings({"ABCD", "EFGH"}, layout);

    TEST_ASSERT_TRUE_MESSAGE(ok, "Two rows of four keys should fit a 2x4 keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('A', layout.at(0, 0), "First key");
    TEST_ASSERT_EQUAL_INT_MESSAGE('G', layout.at(1, 2), "Row 1, column 2");
    TEST_ASSERT_EQUAL_INT_MESSAGE('H', layout.at(1, 3), "Last key");
}

void test_fromStrings_wrongRowCount_shouldKeepLayout(void) {
    keypad::PhoneLayout layout = keypad::PHONE_LAYOUT;

    bool ok = keypad::PhoneLayout::fromStrings({"ABC", "DEF", "GHI"}, layout);

    TEST_ASSERT_FALSE_MESSAGE(ok, "Three rows should not fit a four row keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('1', layout.at(0, 0), "Layout should be untouched on failure");
}

void test_fromStrings_wrongRowLength_shouldKeepLayout(void) {
    keypad::PhoneLayout layout = keypad::PHONE_LAYOUT;

    bool ok = keypad::PhoneLayout::fromStrings({"ABC", "DEF", "GHIJ", "KLM"}, layout);

    TEST_ASSERT_FALSE_MESSAGE(ok, "A four key row should not fit a three column keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('7', layout.at(2, 0), "Layout should be untouched on failure");
}

void test_config_fullDocument_shouldParseAllFields(void) {
    features::KeypadConfig config;

    bool ok = config.parse(R"({
        "layout": ["ABC", "DEF", "GHI", "JKL"],
        "rowGpios": [5, 6, 13, 19],
        "columnGpios": [12, 16, 20],
        "settleTimeUs": 250,
        "pollIntervalUs": 2000,
        "stableSamples": 5
    })");

    TEST_ASSERT_TRUE_MESSAGE(ok, "Valid document should parse");
    TEST_ASSERT_EQUAL_INT_MESSAGE(4, config.layout.size(), "Four layout rows");
    TEST_ASSERT_EQUAL_STRING_MESSAGE("JKL", config.layout[3].c_str(), "Last layout row");
    TEST_ASSERT_EQUAL_INT_MESSAGE(4, config.rowGpios.size(), "Four row GPIOs");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(19, config.rowGpios[3], "Last row GPIO");
    TEST_ASSERT_EQUAL_INT_MESSAGE(3, config.columnGpios.size(), "Three column GPIOs");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(12, config.columnGpios[0], "First column GPIO");
    TEST_ASSERT_EQUAL_UINT8_MESSAGE(5, config.stableSamples, "Stable sample count");

    keypad::ScannerConfig scannerConfig = config.toScannerConfig();
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(250, scannerConfig.settleTimeUs, "Settle time");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(2000, scannerConfig.pollIntervalUs, "Poll interval");

    keypad::PhoneLayout layout = keypad::PHONE_LAYOUT;
    TEST_ASSERT_TRUE_MESSAGE(config.toLayout(layout), "Layout should fit a phone keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('E', layout.at(1, 1), "Row 1, column 1");
}

void test_config_emptyDocument_shouldUseDefaults(void) {
    features::KeypadConfig config;

    bool ok = config.parse("{}");

    TEST_ASSERT_TRUE_MESSAGE(ok, "Empty object should parse");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(keypad::ScannerConfig::DEFAULT_SETTLE_TIME_US, config.settleTimeUs, "Default settle time");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(keypad::ScannerConfig::DEFAULT_POLL_INTERVAL_US, config.pollIntervalUs, "Default poll interval");
    TEST_ASSERT_TRUE_MESSAGE(config.rowGpios.empty(), "No default row GPIOs");

    const keypad::PhoneLayout::Table letters = {{ {{'a', 'b', 'c'}}, {{'d', 'e', 'f'}}, {{'g', 'h', 'i'}}, {{'j', 'k', 'l'}} }};
    keypad::PhoneLayout layout(letters);
    TEST_ASSERT_TRUE_MESSAGE(config.toLayout(layout), "Default layout should fit a phone keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('#', layout.at(3, 2), "Default layout is the phone layout");
}

void test_config_malformedDocument_shouldKeepValues(void) {
    features::KeypadConfig config;
    config.settleTimeUs = 123;

    bool ok = config.parse("{\"settleTimeUs\": 10,");

    TEST_ASSERT_FALSE_MESSAGE(ok, "Truncated document should be rejected");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(123, config.settleTimeUs, "Config should be untouched on failure");
}

void test_config_wrongType_shouldBeRejected(void) {
    features::KeypadConfig config;

    bool ok = config.parse(R"({"rowGpios": "5,6,13,19"})");

    TEST_ASSERT_FALSE_MESSAGE(ok, "GPIO list given as a string should be rejected");
}

void test_config_outOfRange_shouldBeRejected(void) {
    features::KeypadConfig config;
    config.stableSamples = 4;
    config.settleTimeUs = 123;

    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"stableSamples": 300})"), "300 samples does not fit the sample counter");
    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"settleTimeUs": -1})"), "Negative settle time should be rejected");
    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"settleTimeUs": 0})"), "Zero settle time should be rejected");
    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"settleTimeUs": 2.5})"), "Fractional settle time should be rejected");
    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"pollIntervalUs": 4294967296})"), "Poll interval beyond 32 bits should be rejected");
    TEST_ASSERT_FALSE_MESSAGE(config.parse(R"({"rowGpios": [5, -1, 13, 19]})"), "Negative GPIO number should be rejected");
    TEST_ASSERT_EQUAL_UINT8_MESSAGE(4, config.stableSamples, "Config should be untouched on failure");
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(123, config.settleTimeUs, "Config should be untouched on failure");

    TEST_ASSERT_TRUE_MESSAGE(config.parse(R"({"stableSamples": 255, "settleTimeUs": 1000000, "pollIntervalUs": 0})"),
                             "Values at the limits should be accepted");
    TEST_ASSERT_EQUAL_UINT8_MESSAGE(255, config.stableSamples, "Largest sample count");
}

void test_config_loadFromFile_outOfRange_shouldBeRejected(void) {
    char path[] = "/tmp/keypad_config_XXXXXX";
    int fd = mkstemp(path);
    TEST_ASSERT_TRUE_MESSAGE(fd >= 0, "Should create a temporary file");
    close(fd);

    {
        std::ofstream file(path);
        file << R"({"columnGpios": [1, 2, 3], "stableSamples": 300})";
    }

    features::KeypadConfig config;
    bool ok = config.loadFromFile(path);
    std::remove(path);

    TEST_ASSERT_FALSE_MESSAGE(ok, "File with an out of range value should be rejected");
    TEST_ASSERT_TRUE_MESSAGE(config.columnGpios.empty(), "Config should be untouched on failure");
    TEST_ASSERT_EQUAL_UINT8_MESSAGE(3, config.stableSamples, "Default sample count should be kept");
}

void test_config_layoutForOtherKeypad_shouldNotConvert(void) {
    features::KeypadConfig config;
    TEST_ASSERT_TRUE(config.parse(R"({"layout": ["123A", "456B", "789C", "*0#D"]})"));

    keypad::PhoneLayout layout = keypad::PHONE_LAYOUT;
    TEST_ASSERT_FALSE_MESSAGE(config.toLayout(layout), "4x4 layout should not fit a phone keypad");

    const keypad::KeypadLayout<4, 4>::Table dashes = {{
        {{'-', '-', '-', '-'}}, {{'-', '-', '-', '-'}}, {{'-', '-', '-', '-'}}, {{'-', '-', '-', '-'}}
    }};
    keypad::KeypadLayout<4, 4> wide(dashes);
    TEST_ASSERT_TRUE_MESSAGE(config.toLayout(wide), "4x4 layout should fit a 4x4 keypad");
    TEST_ASSERT_EQUAL_INT_MESSAGE('D', wide.at(3, 3), "Row 3, column 3");
}

void test_config_loadFromFile_shouldReadDocument(void) {
    char path[] = "/tmp/keypad_config_XXXXXX";
    int fd = mkstemp(path);
    TEST_ASSERT_TRUE_MESSAGE(fd >= 0, "Should create a temporary file");
    close(fd);

    {
        std::ofstream file(path);
        file << R"({"columnGpios": [1, 2, 3], "stableSamples": 7})";
    }

    features::KeypadConfig config;
    bool ok = config.loadFromFile(path);
    std::remove(path);

    TEST_ASSERT_TRUE_MESSAGE(ok, "Existing file should load");
    TEST_ASSERT_EQUAL_INT_MESSAGE(3, config.columnGpios.size(), "Three column GPIOs");
    TEST_ASSERT_EQUAL_UINT8_MESSAGE(7, config.stableSamples, "Stable sample count");
}

void test_config_loadFromMissingFile_shouldFail(void) {
    features::KeypadConfig config;

    TEST_ASSERT_FALSE_MESSAGE(config.loadFromFile("/nonexistent/keypad.json"), "Missing file should fail");
    TEST_ASSERT_EQUAL_INT_MESSAGE(4, config.layout.size(), "Defaults should be kept");
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_phoneLayout_shouldMatchTelephoneKeypad);
    RUN_TEST(test_isValid_duplicateKey_shouldFail);
    RUN_TEST(test_isValid_noKeyCharacter_shouldFail);
    RUN_TEST(test_singleRowLayout_shouldBuildFromTable);
    RUN_TEST(test_fromStrings_matchingDimensions_shouldBuildLayout);
    RUN_TEST(test_fromStrings_wrongRowCount_shouldKeepLayout);
    RUN_TEST(test_fromStrings_wrongRowLength_shouldKeepLayout);
    RUN_TEST(test_config_fullDocument_shouldParseAllFields);
    RUN_TEST(test_config_emptyDocument_shouldUseDefaults);
    RUN_TEST(test_config_malformedDocument_shouldKeepValues);
    RUN_TEST(test_config_wrongType_shouldBeRejected);
    RUN_TEST(test_config_outOfRange_shouldBeRejected);
    RUN_TEST(test_config_loadFromFile_outOfRange_shouldBeRejected);
    RUN_TEST(test_config_layoutForOtherKeypad_shouldNotConvert);
    RUN_TEST(test_config_loadFromFile_shouldReadDocument);
    RUN_TEST(test_config_loadFromMissingFile_shouldFail);
    return UNITY_END();
}

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
