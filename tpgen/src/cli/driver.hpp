//! # Generator Driver Interface
//!
//! This header defines the main entry point for tpgen.
//!
//! ## Entry Point
//!
//! `tpgen_main()` parses argv, declares the turnip tracepoints and writes
//! the three generated artifacts.

#pragma once

// Main generator entry point
// Returns 0 on success, 1 on invocation, configuration or write errors
int tpgen_main(int argc, char* argv[]);
