#include "option_parser.hpp"
#include "sys/home_directory.hpp"

#include <getopt.h>

namespace {

enum LongOnly {
    OPT_DELETE = 256,
};

} // namespace

OptionParser::OptionParser(int argc, char* argv[])
    : m_argc(argc), m_argv(argv) {}

std::string OptionParser::usage(const std::string& program)
{
    return "Usage: " + program + " [OPTIONS]... TARGET...\n"
        R"(Synchronize files and directories with other hosts over SSH.

Targets:
    TARGET                  host name or alias from the configuration file.
                            "all" synchronizes with every other host.

Options:
    -h, --help              show this help and exit.
    -V, --version           show version and exit.
    -f FILE,                configuration file.
    --configfile FILE       by default, ~/.sync.yml is used.
    -l FILE, --logfile FILE log file. by default, ~/.sync.log is used.
    -e PATTERN,             exclude files matching PATTERN.
    --exclude PATTERN       may be given several times.
    -d, --down              only download files.
    -u, --up                only upload files.
    -n, --dry-run           simulate the run.
    -q, --quiet             suppress output to stdout.
    -Q, --no-logfile        suppress output to the log file.
    -v, --verbose           show debug output.
    -j N, --jobs N          allow N transfers per host and direction at once.
                            by default, 6 is used.
    -r FILE, --report FILE  write a JSON report of the run to FILE.
    --delete                delete files that do not exist on the sending
                            host. use with care!
)";
}

size_t OptionParser::toJobs(const std::string& value)
{
    long jobs;
    try{
        size_t consumed = 0;
        jobs = std::stol(value, &consumed, 0);
        if(consumed != value.size()){
            throw std::invalid_argument(value);
        }
    }catch(const std::exception&){
        throw OptionError("can't convert to number: '" + value + "'");
    }
    if(jobs < 1){
        throw OptionError("invalid number of jobs: " + std::to_string(jobs));
    }
    return static_cast<size_t>(jobs);
}

CommandLine OptionParser::parse() const
{
    CommandLine cmd;
    cmd.configFile = DEFAULT_CONFIG;
    cmd.logFile = DEFAULT_LOG;

    // restart scanning, parse() may run more than once per process
    optind = 0;
    opterr = 0;
    while(true){
        int option_index = 0;
        option longopts[] = {
            {"help",             no_argument, nullptr, 'h'},
            {"version",          no_argument, nullptr, 'V'},
            {"configfile", required_argument, nullptr, 'f'},
            {"logfile",    required_argument, nullptr, 'l'},
            {"exclude",    required_argument, nullptr, 'e'},
            {"down",             no_argument, nullptr, 'd'},
            {"up",               no_argument, nullptr, 'u'},
            {"dry-run",          no_argument, nullptr, 'n'},
            {"quiet",            no_argument, nullptr, 'q'},
            {"no-logfile",       no_argument, nullptr, 'Q'},
            {"verbose",          no_argument, nullptr, 'v'},
            {"jobs",       required_argument, nullptr, 'j'},
            {"report",     required_argument, nullptr, 'r'},
            {"delete",           no_argument, nullptr, OPT_DELETE},
            {}
        };

        int c = getopt_long(m_argc, m_argv, "hVf:l:e:dunqQvj:r:", longopts, &option_index);
        if(c == -1){
            break;
        }

        switch(c){
        case 'h': cmd.showHelp = true; break;
        case 'V': cmd.showVersion = true; break;
        case 'f': cmd.configFile = optarg; break;
        case 'l': cmd.logFile = optarg; break;
        case 'e': cmd.sync.excludes.emplace_back(optarg); break;
        case 'd': cmd.sync.downOnly = true; break;
        case 'u': cmd.sync.upOnly = true; break;
        case 'n': cmd.sync.dryRun = true; break;
        case 'q': cmd.quiet = true; break;
        case 'Q': cmd.noLogfile = true; break;
        case 'v': cmd.verbose = true; break;
        case 'j': cmd.sync.concurrencyLimit = toJobs(optarg); break;
        case 'r': cmd.reportFile = sys::expandUser(optarg); break;
        case OPT_DELETE: cmd.sync.deleteExtraneous = true; break;
        case ':':
        case '?':
            if(optopt != 0){
                throw OptionError(std::string("unknown option or missing value: '-")
                        + static_cast<char>(optopt) + '\'');
            }
            throw OptionError(std::string("unknown option: '") + m_argv[optind - 1] + '\'');
        default:
            break;
        }
    }

    for(int i = optind; i < m_argc; ++i){
        cmd.targets.emplace_back(m_argv[i]);
    }

    cmd.configFile = sys::expandUser(cmd.configFile);
    cmd.logFile = sys::expandUser(cmd.logFile);

    if(cmd.targets.empty() && !cmd.showHelp && !cmd.showVersion){
        throw OptionError("no target host given");
    }
    return cmd;
}
