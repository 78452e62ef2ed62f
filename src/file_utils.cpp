#include <sys/stat.h>
#include <cstdio>
#include <fstream>
#include <file_utils.h>
#include "logger.h"

bool directory_exists(const std::string& dir_path) {
    struct stat info;
    return stat(dir_path.c_str(), &info) == 0 && (info.st_mode & S_IFDIR);
}

bool file_exists(const std::string & file_path) {
    struct stat info;
    return stat(file_path.c_str(), &info) == 0 && !(info.st_mode & S_IFDIR);
}

bool read_file_lines(const std::string& file_path, std::vector<std::string>& lines) {
    std::ifstream infile(file_path);
    if(!infile.is_open()) {
        LOG(WARNING) << "Unable to open " << file_path << " for reading.";
        return false;
    }

    std::string line;
    while(std::getline(infile, line)) {
        lines.push_back(line);
    }

    return !infile.bad();
}

bool write_file_atomically(const std::string& file_path, const std::string& content) {
    const std::string tmp_path = file_path + ".tmp";

    {
        std::ofstream outfile(tmp_path, std::ios::out | std::ios::trunc);
        if(!outfile.is_open()) {
            LOG(WARNING) << "Unable to open " << tmp_path << " for writing.";
            return false;
        }

        outfile << content;
        outfile.flush();

        if(!outfile.good()) {
            LOG(WARNING) << "Write to " << tmp_path << " failed.";
            return false;
        }
    }

    struct stat info;
    if(stat(file_path.c_str(), &info) == 0) {
        // keep the permissions of the file being replaced
        chmod(tmp_path.c_str(), info.st_mode & 07777);
    }

    if(std::rename(tmp_path.c_str(), file_path.c_str()) != 0) {
        LOG(WARNING) << "Rename of " << tmp_path << " to " << file_path << " failed.";
        std::remove(tmp_path.c_str());
        return false;
    }

    return true;
}

bool append_to_file(const std::string& file_path, const std::string& content) {
    std::ofstream outfile(file_path, std::ios::out | std::ios::app);
    if(!outfile.is_open()) {
        LOG(WARNING) << "Unable to open " << file_path << " for appending.";
        return false;
    }

    outfile << content;
    outfile.flush();
    return outfile.good();
}
