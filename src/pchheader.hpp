#ifndef _HC_PCHHEADER_
#define _HC_PCHHEADER_

// Enable boost strack trace.
#define BOOST_STACKTRACE_USE_BACKTRACE

#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <boost/stacktrace.hpp>
#include <chrono>
#include <concurrentqueue.h>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <functional>
#include <iomanip>
#include <iostream>
#include <jsoncons/json.hpp>
#include <libgen.h>
#include <limits.h>
#include <list>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <poll.h>
#include <readerwriterqueue/readerwriterqueue.h>
#include <set>
#include <signal.h>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#endif
