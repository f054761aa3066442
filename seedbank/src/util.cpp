#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "util.hpp"

namespace seedbank
{
    std::string DirPlusFile(const std::string &dir, const std::string &file)
    {
        if (dir.empty())
        {
            return file;
        }
        if (dir[dir.size() - 1] == '/')
        {
            return dir + file;
        }
        return dir + "/" + file;
    }

    bool PathExists(const std::string &path)
    {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    bool MakeDirectories(const std::string &path)
    {
        if (path.empty())
        {
            return false;
        }

        // create each prefix ending just before a '/', then the full path
        size_t next_slash = path.find('/', 1);
        while (true)
        {
            std::string prefix = next_slash == std::string::npos
                ? path
                : path.substr(0, next_slash);

            if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST)
            {
                return false;
            }

            if (next_slash == std::string::npos)
            {
                break;
            }
            next_slash = path.find('/', next_slash + 1);
        }

        struct stat st;
        return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }

    bool ReadFile(const std::string &path, std::vector<uint8_t> &out)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary | std::ios::ate);
        if (!in.is_open())
        {
            return false;
        }

        std::streamoff size = in.tellg();
        if (size < 0)
        {
            return false;
        }
        in.seekg(0, std::ios::beg);

        out.resize(static_cast<size_t>(size));
        if (size > 0)
        {
            in.read(reinterpret_cast<char *>(out.data()), size);
        }

        return !in.fail();
    }

    bool WriteFileAtomic(const std::string &path, const uint8_t *data, size_t len)
    {
        // the temporary lives next to the target so rename() stays on one filesystem
        size_t slash = path.rfind('/');
        std::string tmp_path = slash == std::string::npos
            ? "." + path + ".tmp"
            : path.substr(0, slash + 1) + "." + path.substr(slash + 1) + ".tmp";

        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                return false;
            }

            out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
            out.flush();
            if (out.fail())
            {
                out.close();
                unlink(tmp_path.c_str());
                return false;
            }
        }

        if (rename(tmp_path.c_str(), path.c_str()) != 0)
        {
            unlink(tmp_path.c_str());
            return false;
        }

        return true;
    }

    bool ListRegularFiles(const std::string &dir, std::vector<std::string> &out)
    {
        DIR *d = opendir(dir.c_str());
        if (d == nullptr)
        {
            return false;
        }

        struct dirent *ent;
        while ((ent = readdir(d)) != nullptr)
        {
            std::string name(ent->d_name);
            if (name.empty() || name[0] == '.')
            {
                continue;
            }

            // d_type is not filled in on every filesystem, so stat() to be sure
            struct stat st;
            std::string full = DirPlusFile(dir, name);
            if (stat(full.c_str(), &st) == 0 && S_ISREG(st.st_mode))
            {
                out.push_back(name);
            }
        }
        closedir(d);

        std::sort(out.begin(), out.end());
        return true;
    }
}
