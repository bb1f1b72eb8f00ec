//
// Created by fieldrel on 10/17/26.
//

#include <iostream>

#include <unistd.h>

#include "Application.hpp"

namespace fieldrel {
    int Application::exec(int argc, char **argv) {
        if (!parseArgs(argc, argv)) {
            return 1;
        }
        
        return main();
    }
    
    bool Application::parseArgs(int argc, char **argv) {
        _programName = argc > 0 ? argv[0] : "";
        _args.clear();
        _positionalArgs.clear();
        
        const auto options = optString();
        
        opterr = 0;
        optind = 1;
        
        int option;
        while ((option = getopt(argc, argv, options.c_str())) != -1) {
            if (option == '?') {
                std::cerr << _programName << ": invalid option or missing argument: -"
                          << static_cast<char>(optopt) << std::endl;
                return false;
            }
            
            _args[static_cast<char>(option)] = optarg != nullptr ? optarg : "";
        }
        
        for (int i = optind; i < argc; i++) {
            _positionalArgs.emplace_back(argv[i]);
        }
        
        return true;
    }
    
    bool Application::isArgSet(char option) const {
        return _args.find(option) != _args.end();
    }
    
    std::string Application::getArg(char option) const {
        auto it = _args.find(option);
        if (it == _args.end()) {
            return {};
        }
        
        return it->second;
    }
    
    const std::vector<std::string> &Application::positionalArgs() const {
        return _positionalArgs;
    }
    
    const std::string &Application::programName() const {
        return _programName;
    }
}
