//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_APPLICATION_HPP
#define FIELDREL_APPLICATION_HPP

#include <map>
#include <string>
#include <vector>

namespace fieldrel {
    /**
     * @brief getopt(3) based command-line application skeleton.
     *
     * subclasses supply the option string and a main(); exec() parses argv and runs main().
     */
    class Application {
    public:
        Application() = default;
        virtual ~Application() = default;
        
        int exec(int argc, char **argv);
        
    protected:
        /**
         * @return getopt(3) option string, e.g. "c:d:vh"
         */
        virtual std::string optString() = 0;
        virtual int main() = 0;
        
        bool isArgSet(char option) const;
        std::string getArg(char option) const;
        
        /**
         * @return non-option arguments, in order
         */
        const std::vector<std::string> &positionalArgs() const;
        
        const std::string &programName() const;
        
    private:
        bool parseArgs(int argc, char **argv);
        
        std::string _programName;
        std::map<char, std::string> _args;
        std::vector<std::string> _positionalArgs;
    };
}

#endif //FIELDREL_APPLICATION_HPP
