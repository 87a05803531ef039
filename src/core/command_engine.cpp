/**
 * @file command_engine.cpp
 * @brief Core implementation of the command execution engine.
 *
 * An invocation goes through three phases:
 * 1. Forward to an active SSH session, if the session has one (see command_engine_remote.cpp).
 * 2. Local `cd`, resolved against the session's tracked directory without spawning.
 * 3. Spawn a new process: ssh/sshpass directly, everything else as `sh -c "exec ..."`.
 */

#include "core/command_engine.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/path_resolver.hpp"
#include "core/stream_workers.hpp"
#include <csignal>
#include <format>
#include <sstream>
#include <system_error>

namespace tabvisor::core {

    namespace {
        // ssh options that consume the following token as their value
        constexpr std::string_view kSshOptionsWithValue = "BbcDEeFIiJLlmOoPpQRSWw";

        std::vector<std::string> split_whitespace(std::string_view text) {
            std::istringstream ss{std::string(text)};
            std::vector<std::string> tokens;
            std::string token;
            while (ss >> token) tokens.push_back(token);
            return tokens;
        }

        bool is_ssh_keyword(const std::string& token) {
            return token == "ssh" || (token.size() > 4 && token.ends_with("/ssh"));
        }
    }

    SshInvocation parse_ssh_invocation(std::string_view command) {
        SshInvocation inv;
        std::vector<std::string> tokens = split_whitespace(command);
        if (tokens.empty() || !is_ssh_keyword(tokens[0])) return inv;

        inv.is_ssh = true;
        inv.args.assign(tokens.begin() + 1, tokens.end());

        // Find the host: first argument that is neither an option nor an option's value
        for (size_t i = 0; i < inv.args.size(); ++i) {
            const std::string& a = inv.args[i];
            if (a.starts_with('-')) {
                if (a.size() == 2 && kSshOptionsWithValue.find(a[1]) != std::string_view::npos) ++i;
                continue;
            }
            inv.interactive = (i == inv.args.size() - 1);
            break;
        }
        return inv;
    }

    // ==================================================================================
    // PUBLIC API
    // ==================================================================================

    CommandEngine::CommandEngine(std::shared_ptr<SessionRegistry> registry,
                                 std::shared_ptr<EventSink> sink,
                                 Config config)
        : registry_(std::move(registry)), sink_(std::move(sink)), config_(std::move(config)) {
        // A remote client that died must show up as EPIPE on the forwarding write
        std::signal(SIGPIPE, SIG_IGN);
    }

    ExecOutcome CommandEngine::execute_command(const std::string& command,
                                               const std::string& session_id,
                                               const std::optional<std::string>& password) {
        try {
            return dispatch(command, session_id, password);
        } catch (const std::system_error& e) {
            // std::mutex::lock failure
            throw EngineError(ErrorKind::LockFailure, e.what());
        }
    }

    std::string CommandEngine::current_directory(const std::string& session_id) {
        try {
            return registry_->get_or_create(session_id).current_dir;
        } catch (const std::system_error& e) {
            throw EngineError(ErrorKind::LockFailure, e.what());
        }
    }

    void CommandEngine::terminate_command(const std::string& session_id) {
        std::shared_ptr<ChildProcess> process;
        try {
            process = registry_->get_or_create(session_id).process;
        } catch (const std::system_error& e) {
            throw EngineError(ErrorKind::LockFailure, e.what());
        }

        if (!process) {
            throw EngineError(ErrorKind::NotFound, std::format("No running process for session '{}'", session_id));
        }
        if (!process->signal(SIGTERM)) {
            throw EngineError(ErrorKind::NotFound, std::format("Process {} is no longer running", process->pid()));
        }
        log::debug(std::format("Sent SIGTERM to pid {} (session {})", process->pid(), session_id));
    }

    void CommandEngine::emit(EventKind kind, const std::string& session_id, pid_t pid, std::string text, bool success) {
        Event event;
        event.kind = kind;
        event.session_id = session_id;
        event.pid = pid;
        event.text = std::move(text);
        event.success = success;
        sink_->emit(event);
    }

    // ==================================================================================
    // DISPATCH
    // ==================================================================================

    ExecOutcome CommandEngine::dispatch(const std::string& command, const std::string& session_id,
                                        const std::optional<std::string>& password) {
        if (auto forwarded = try_forward_to_remote(command, session_id)) {
            return *forwarded;
        }

        if (is_cd_command(command)) {
            return change_directory(command, session_id);
        }

        return spawn_command(command, session_id, password);
    }

    ExecOutcome CommandEngine::change_directory(const std::string& command, const std::string& session_id) {
        std::string current = registry_->get_or_create(session_id).current_dir;

        std::filesystem::path target;
        try {
            target = resolve_cd_target(cd_argument(command), current, home_directory());
        } catch (const EngineError&) {
            emit(EventKind::CommandEnded, session_id, 0, "Command failed.", false);
            throw;
        }

        std::string new_dir = target.string();
        registry_->with_session(session_id, [&](SessionState& s) { s.current_dir = new_dir; });

        emit(EventKind::CommandEnded, session_id, 0, "Command completed successfully.", true);
        return {ExecStatus::DirectoryChanged, std::format("Changed directory to {}", new_dir)};
    }

    // ==================================================================================
    // SPAWN
    // ==================================================================================

    ExecOutcome CommandEngine::spawn_command(const std::string& command, const std::string& session_id,
                                             const std::optional<std::string>& password) {
        std::string current_dir = registry_->get_or_create(session_id).current_dir;

        SshInvocation ssh = parse_ssh_invocation(command);
        if (ssh.is_ssh && !password && config_.ssh_require_password) {
            emit(EventKind::PasswordNeeded, session_id, 0, command);
            return {ExecStatus::NeedsPassword, kNeedsPasswordMarker};
        }

        const bool remote_starter = ssh.is_ssh && ssh.interactive;

        SpawnOptions opts;
        opts.cwd = current_dir;
        opts.env = inherited_environment(config_.fallback_path);

        if (ssh.is_ssh) {
            std::vector<std::string> ssh_argv{config_.ssh_program};
            ssh_argv.insert(ssh_argv.end(), config_.ssh_options.begin(), config_.ssh_options.end());
            ssh_argv.insert(ssh_argv.end(), ssh.args.begin(), ssh.args.end());

            if (password) {
                opts.argv = {config_.sshpass_program, "-p", *password};
                opts.argv.insert(opts.argv.end(), ssh_argv.begin(), ssh_argv.end());
            } else {
                opts.argv = std::move(ssh_argv);
            }
        } else {
            // exec: the command replaces the shell, so the recorded pid is the command itself
            opts.argv = {config_.exec_shell, "-c", "exec " + command};
            opts.new_session = true;
        }

        SpawnedProcess spawned = spawn_piped(opts);
        const pid_t pid = spawned.child->pid();
        auto stdin_writer = std::make_shared<PipeWriter>(std::move(spawned.stdin_fd));

        registry_->with_session(session_id, [&](SessionState& s) {
            s.pid = pid;
            s.process = spawned.child;
            if (remote_starter) {
                s.stdin_writer = stdin_writer;
                s.is_remote_session_active = true;
                s.remote_current_dir = kRemoteDirPlaceholder;
            } else {
                s.end_remote();
            }
        });

        log::debug(std::format("Session {} spawned pid {} ({})", session_id, pid, opts.argv[0]));

        if (remote_starter) {
            emit(EventKind::RemoteSessionStarted, session_id, pid);
            send_initial_pwd_probe(session_id, pid, stdin_writer);
        }

        WorkerContext ctx;
        ctx.registry = registry_;
        ctx.sink = sink_;
        ctx.session_id = session_id;
        ctx.pid = pid;
        if (remote_starter) ctx.remote_writer = stdin_writer;
        ctx.password_prompt_patterns = config_.password_prompt_patterns;

        launch_stream_workers(ctx, spawned.child, std::move(spawned.stdout_fd), std::move(spawned.stderr_fd), true);

        return {ExecStatus::Started, kStartedMessage};
    }
}
