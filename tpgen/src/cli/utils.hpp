//! # CLI Utilities Interface
//!
//! | Function          | Description                |
//! |-------------------|----------------------------|
//! | `print_usage()`   | Print CLI help text        |
//! | `print_version()` | Print generator version    |

#pragma once
#include <iostream>

namespace tpgen::cli {

// Help text
void print_usage(std::ostream& out = std::cout);
void print_version();

} // namespace tpgen::cli
