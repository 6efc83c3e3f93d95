/**
 * table_shell.cc
 *
 * Table_shell reads commands from stdin and applies them to a single
 * LinearProbeTable<std::string>, so the probing, growth and cluster repair
 * behaviour can be watched by hand.
 */

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <libgen.h>

#include "common/utils.h"
#include "hash_table/linear_probe_table.h"

/** Print a message to inform the user of how to use this program */
void usage(char *progname) {
    printf("%s: Interactive shell over a linear probe hash table.\n",
        basename(progname));
    printf("  -s [int]    Initial table size\n");
    printf("  -h          Print help (this message)\n");
    printf("Commands: set <key> <value>, get <key>, del <key>, hash <key>,\n"
           "          len, cap, empty, full, print, quit\n");
}

struct arg_t {
    /** Requested initial size of the table */
    int table_size = LinearProbeTable<std::string>::DEFAULT_TABLE_SIZE;

    /** Is the user requesting a usage message? */
    bool usage = false;
};

void parse_args(int argc, char **argv, arg_t &args) {
    long opt;
    while ((opt = getopt(argc, argv, "s:h")) != -1) {
        switch (opt) {
        case 's':
        args.table_size = atoi(optarg);
        break;
        default:
        args.usage = true;
        break;
        }
    }
}

// Runs one command line, returns false on quit
bool handle_command(LinearProbeTable<std::string> &table, const std::string &line) {
    std::stringstream ss(line);
    std::string cmd, key;
    if (!(ss >> cmd)) {
        return true;
    }

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "len") {
        std::cout << table.get_count() << "\n";
    } else if (cmd == "cap") {
        std::cout << table.get_capacity() << "\n";
    } else if (cmd == "empty") {
        std::cout << (table.is_empty() ? "true" : "false") << "\n";
    } else if (cmd == "full") {
        std::cout << (table.is_full() ? "true" : "false") << "\n";
    } else if (cmd == "print") {
        table.print_table();
    } else if (cmd == "set" || cmd == "get" || cmd == "del" || cmd == "hash") {
        if (!(ss >> key)) {
            std::cout << "error: " << cmd << " needs a key\n";
            return true;
        }

        try {
            if (cmd == "set") {
                std::string value;
                if (!(ss >> value)) {
                    std::cout << "error: set needs a value\n";
                    return true;
                }
                size_t before = table.get_capacity();
                table.set(key, value);
                if (table.get_capacity() != before) {
                    log_info("Shell", "Table grew " + std::to_string(before) + " -> " +
                             std::to_string(table.get_capacity()));
                }
            } else if (cmd == "get") {
                std::cout << table.get(key) << "\n";
            } else if (cmd == "del") {
                table.remove(key);
            } else {
                std::cout << table.hash(key) << "\n";
            }
        } catch (const KeyNotFoundError &e) {
            std::cout << "key not found: " << e.key() << "\n";
        }
    } else {
        std::cout << "error: unknown command '" << cmd << "'\n";
    }

    return true;
}

int main(int argc, char** argv) {
    arg_t args;
    parse_args(argc, argv, args);
    if (args.usage) {
        usage(argv[0]);
        return 1;
    }

    try {
        LinearProbeTable<std::string> table(args.table_size);
        log_info("Shell", "Table of size " + std::to_string(table.get_capacity()) + " ready");

        std::string line;
        while (std::getline(std::cin, line)) {
            if (!handle_command(table, line)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        log_fatal(e.what());
        return 1;
    }

    return 0;
}
