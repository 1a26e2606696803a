// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the DocShield unit and integration suites.
// Each suite lives in a header under test/unit or test/integration.

#include <gtest/gtest.h>

#include "util/logger.hpp"

#include "test/unit/test_text_utils.hpp"
#include "test/unit/test_config_parser.hpp"
#include "test/unit/test_thread_pool.hpp"
#include "test/unit/test_detection_rules.hpp"
#include "test/unit/test_sanitizer.hpp"
#include "test/unit/test_highlighter.hpp"
#include "test/unit/test_aggregator.hpp"
#include "test/unit/test_pdf_adapter.hpp"
#include "test/unit/test_docx_adapter.hpp"
#include "test/unit/test_scan_report.hpp"

#include "test/integration/test_document_scanner.hpp"
#include "test/integration/test_scan_session.hpp"
#include "test/integration/test_scan_history.hpp"

int main(int argc, char** argv) {
    // keep test output readable; failures are reported by gtest itself
    docshield::util::logger::setLogLevel(docshield::util::logger::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
