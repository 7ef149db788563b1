#include "audio/CommandSpeechSynthesizer.h"

#include <utility>

#include "telemetry/TelemetrySink.h"

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace
{

#ifndef _WIN32

class FileDescriptor
{
  public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const { return m_fd; }
    void reset()
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
            m_fd = -1;
        }
    }

  private:
    int m_fd = -1;
};

std::string errnoMessage(const char *what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

void setNonBlocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0)
    {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

#endif

} // namespace

CommandSpeechSynthesizer::CommandSpeechSynthesizer(std::vector<std::string> command, std::shared_ptr<TelemetrySink> telemetry)
    : m_command(std::move(command)), m_telemetry(std::move(telemetry))
{
}

#ifdef _WIN32

SynthesisResult CommandSpeechSynthesizer::synthesize(const std::string &, std::chrono::steady_clock::time_point) const
{
    SynthesisResult result;
    result.error = "external synthesizer is not supported on this platform";
    return result;
}

#else

SynthesisResult CommandSpeechSynthesizer::synthesize(const std::string &text,
                                                     std::chrono::steady_clock::time_point deadline) const
{
    SynthesisResult result;
    if (m_command.empty())
    {
        result.error = "no synthesizer command configured";
        return result;
    }

    int inputPipe[2] = {-1, -1};
    int outputPipe[2] = {-1, -1};
    if (::pipe(inputPipe) != 0)
    {
        result.error = errnoMessage("pipe");
        return result;
    }
    FileDescriptor inputRead(inputPipe[0]);
    FileDescriptor inputWrite(inputPipe[1]);
    if (::pipe(outputPipe) != 0)
    {
        result.error = errnoMessage("pipe");
        return result;
    }
    FileDescriptor outputRead(outputPipe[0]);
    FileDescriptor outputWrite(outputPipe[1]);

    std::vector<char *> argv;
    argv.reserve(m_command.size() + 1);
    for (const std::string &arg : m_command)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t child = ::fork();
    if (child < 0)
    {
        result.error = errnoMessage("fork");
        return result;
    }
    if (child == 0)
    {
        ::dup2(inputRead.get(), STDIN_FILENO);
        ::dup2(outputWrite.get(), STDOUT_FILENO);
        ::close(inputPipe[0]);
        ::close(inputPipe[1]);
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    inputRead.reset();
    outputWrite.reset();
    setNonBlocking(inputWrite.get());
    setNonBlocking(outputRead.get());

    std::size_t written = 0;
    if (text.empty())
    {
        inputWrite.reset();
    }
    bool outputOpen = true;
    bool killed = false;
    std::uint8_t chunk[4096];

    while (outputOpen)
    {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            ::kill(child, SIGKILL);
            killed = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = {outputRead.get(), POLLIN, 0};
        if (inputWrite.get() >= 0)
        {
            fds[count++] = {inputWrite.get(), POLLOUT, 0};
        }
        const int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            result.error = errnoMessage("poll");
            ::kill(child, SIGKILL);
            killed = true;
            break;
        }

        if (count > 1 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP)) != 0)
        {
            const ssize_t n = ::write(inputWrite.get(), text.data() + written, text.size() - written);
            if (n > 0)
            {
                written += static_cast<std::size_t>(n);
            }
            if ((n < 0 && errno != EAGAIN && errno != EINTR) || written >= text.size())
            {
                inputWrite.reset();
            }
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
        {
            const ssize_t n = ::read(outputRead.get(), chunk, sizeof(chunk));
            if (n > 0)
            {
                result.audio.insert(result.audio.end(), chunk, chunk + n);
            }
            else if (n == 0 || (errno != EAGAIN && errno != EINTR))
            {
                outputOpen = false;
            }
        }
    }

    inputWrite.reset();
    outputRead.reset();

    int status = 0;
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR)
    {
    }

    if (killed)
    {
        result.timedOut = result.error.empty();
        if (result.error.empty())
        {
            result.error = "synthesizer deadline exceeded";
        }
        result.audio.clear();
        telemetry::emit(m_telemetry, "tts.timeout", {{"program", m_command.front()}});
        return result;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        result.error = "synthesizer exited with status " +
                       std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        result.audio.clear();
        return result;
    }
    if (result.audio.empty())
    {
        result.error = "synthesizer produced no audio";
        return result;
    }
    result.success = true;
    return result;
}

#endif
