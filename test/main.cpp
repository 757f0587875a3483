// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

#include <iostream>

int main() {
    // Keep expected WARN lines (record conflicts, config parse fallbacks)
    // out of the test report; tests that assert on log output capture it.
    core::Logger::instance().set_print_to_console(false);

    std::cout << "ZNS Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests();
}
