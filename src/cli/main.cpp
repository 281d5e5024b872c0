//! # strand Entry Point
//!
//! Delegates to `strand_main()`, which sets up logging, parses the command
//! line and runs the tool.

#include "strand/cli/cli.hpp"

int main(int argc, char* argv[]) {
    return strand::cli::strand_main(argc, argv);
}
