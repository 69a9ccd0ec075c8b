/**
 * OfflineCatalog.cpp - Static command, flag and explanation tables for offline mode
 */

#include "hint/OfflineCatalog.hpp"

#include <algorithm>
#include <map>

namespace hint {

namespace {

const std::vector<CatalogEntry> BASIC_COMMANDS = {
    {"ls", "List directory contents"},
    {"cd", "Change directory"},
    {"mkdir", "Make directories"},
    {"rm", "Remove files or directories"},
    {"cp", "Copy files and directories"},
    {"mv", "Move/rename files"},
    {"cat", "Display file contents"},
    {"grep", "Search file patterns"},
    {"find", "Search for files"},
    {"ps", "Show process status"},
    {"kill", "Terminate processes"},
    {"chmod", "Change file permissions"},
    {"chown", "Change file owner/group"},
    {"sudo", "Execute command as superuser"},
    {"apt", "Package management"},
    {"git", "Version control system"},
    {"ssh", "Secure shell client"},
    {"scp", "Secure copy"},
    {"pwd", "Print working directory"},
    {"echo", "Print text"},
    {"touch", "Create empty files or update timestamps"},
    {"tar", "Create or extract archives"},
    {"vim", "Edit files in Vim"},
    {"nano", "Edit files in nano"},
    {"less", "Page through file contents"},
    {"head", "Show the first lines of a file"},
    {"tail", "Show the last lines of a file"},
    {"make", "Run build recipes from a Makefile"},
    {"curl", "Transfer data from or to a server"},
    {"wget", "Download files from the web"},
    {"docker", "Manage containers"},
    {"npm", "Node.js package manager"},
    {"yarn", "Alternative Node.js package manager"},
    {"python", "Run Python"},
    {"pip", "Python package manager"}
};

const std::map<std::string, std::vector<CatalogEntry>> FLAG_TABLES = {
    {"ls", {
        {"-l", "Long listing format"},
        {"-a", "Include hidden files"},
        {"-h", "Human readable sizes"},
        {"-t", "Sort by modification time"},
        {"-R", "List subdirectories recursively"},
        {"-S", "Sort by file size"}
    }},
    {"grep", {
        {"-r", "Search directories recursively"},
        {"-i", "Ignore case"},
        {"-n", "Show line numbers"},
        {"-v", "Invert the match"},
        {"-l", "Only print names of matching files"}
    }},
    {"git", {
        {"--help", "Show help for git"},
        {"--version", "Show the installed git version"},
        {"-C", "Run as if git was started in the given path"}
    }},
    {"rm", {
        {"-r", "Remove directories and their contents"},
        {"-f", "Ignore nonexistent files, never prompt"},
        {"-i", "Prompt before every removal"},
        {"-v", "Explain what is being done"}
    }},
    {"cp", {
        {"-r", "Copy directories recursively"},
        {"-i", "Prompt before overwrite"},
        {"-v", "Explain what is being done"},
        {"-p", "Preserve mode, ownership and timestamps"}
    }},
    {"ps", {
        {"-e", "Select all processes"},
        {"-f", "Full-format listing"},
        {"-u", "Select by effective user"}
    }},
    {"tar", {
        {"-x", "Extract files from an archive"},
        {"-c", "Create a new archive"},
        {"-v", "Verbosely list files processed"},
        {"-z", "Filter the archive through gzip"},
        {"-f", "Use archive file"}
    }},
    {"docker", {
        {"--help", "Show help for docker"},
        {"--version", "Show the docker version"},
        {"-H", "Daemon socket to connect to"}
    }}
};

const std::map<std::string, std::string> EXPLANATIONS = {
    {"ls", "List directory contents. Shows files and folders in the current directory."},
    {"cd", "Change directory. Moves you to a different directory in the filesystem."},
    {"pwd", "Print working directory. Shows your current location in the filesystem."},
    {"mkdir", "Make directory. Creates a new directory with the specified name."},
    {"rm", "Remove files or directories. Permanently deletes specified items."},
    {"cp", "Copy files and directories from one location to another."},
    {"mv", "Move or rename files and directories."},
    {"cat", "Display contents of a file."},
    {"grep", "Search for patterns in files or command output."},
    {"find", "Search for files in a directory hierarchy."},
    {"chmod", "Change file mode (permissions)."},
    {"chown", "Change file owner and group."},
    {"sudo", "Execute a command with superuser privileges."},
    {"ssh", "Secure shell client for remote system access."},
    {"git", "Version control system for tracking changes in files."},
    {"docker", "Platform for developing and running containers."},
    {"npm", "Node.js package manager for installing JavaScript packages."},
    {"yarn", "Alternative package manager for Node.js."},
    {"ping", "Test network connectivity to a host."},
    {"curl", "Transfer data from or to a server."},
    {"wget", "Download files from the web."}
};

const std::vector<std::string> STRUCTURED_COMMANDS = {
    "ls", "cd", "grep", "find", "git", "docker", "npm", "yarn"
};

} // anonymous namespace

const std::vector<CatalogEntry>& basicCommands() {
    return BASIC_COMMANDS;
}

const std::vector<CatalogEntry>& flagsFor(const std::string& base_command) {
    static const std::vector<CatalogEntry> none;
    auto it = FLAG_TABLES.find(base_command);
    return it == FLAG_TABLES.end() ? none : it->second;
}

std::string offlineExplanation(const std::string& command_name) {
    auto it = EXPLANATIONS.find(command_name);
    if (it != EXPLANATIONS.end()) {
        return it->second;
    }
    return "No offline explanation available for \"" + command_name + "\".";
}

bool prefersStructuredExplanation(const std::string& base_command) {
    return std::find(STRUCTURED_COMMANDS.begin(), STRUCTURED_COMMANDS.end(), base_command)
           != STRUCTURED_COMMANDS.end();
}

} // namespace hint
