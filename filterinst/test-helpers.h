//
// Helpers shared by the libfilterinst unit tests.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_TEST_HELPERS_H_
#  define _FILTERINST_TEST_HELPERS_H_

#  include "filterinst/log.h"

#  include <ftw.h>
#  include <stdarg.h>
#  include <stdio.h>
#  include <stdlib.h>
#  include <sys/stat.h>
#  include <string>
#  include <utility>
#  include <vector>

namespace filterinst_test {

// Collects everything a library function logs.
class LogCapture
{
 public:
  static void Func(void *data, fi_loglevel_t level, const char *message, ...)
  {
    char buffer[2048];
    va_list ap;

    va_start(ap, message);
    vsnprintf(buffer, sizeof(buffer), message, ap);
    va_end(ap);

    static_cast<LogCapture *>(data)->messages.push_back(
        std::make_pair(level, std::string(buffer)));
  }

  bool Contains(fi_loglevel_t level, const std::string &text) const
  {
    for (size_t i = 0; i < messages.size(); i ++)
      if (messages[i].first == level &&
          messages[i].second.find(text) != std::string::npos)
        return true;
    return false;
  }

  size_t Count(fi_loglevel_t level) const
  {
    size_t count = 0;
    for (size_t i = 0; i < messages.size(); i ++)
      if (messages[i].first == level)
        count ++;
    return count;
  }

  std::vector<std::pair<fi_loglevel_t, std::string> > messages;
};

// Temporary directory, removed with everything in it on destruction.
class TempDir
{
 public:
  TempDir()
  {
    char tmpl[] = "/tmp/filterinst-test.XXXXXX";
    if (mkdtemp(tmpl))
      path_ = tmpl;
  }

  ~TempDir()
  {
    if (!path_.empty())
      nftw(path_.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
  }

  const std::string &path() const { return path_; }

  std::string Join(const std::string &name) const
  {
    return path_ + "/" + name;
  }

  // Writes a file below the directory, returns its full path.
  std::string WriteFile(const std::string &name, const std::string &contents,
                        mode_t mode = 0644) const
  {
    std::string file = Join(name);
    FILE *fp = fopen(file.c_str(), "wb");
    if (fp)
    {
      fwrite(contents.data(), 1, contents.size(), fp);
      fclose(fp);
      chmod(file.c_str(), mode);
    }
    return file;
  }

  static std::string ReadFile(const std::string &file)
  {
    std::string contents;
    char buffer[4096];
    size_t bytes;
    FILE *fp = fopen(file.c_str(), "rb");
    if (!fp)
      return contents;
    while ((bytes = fread(buffer, 1, sizeof(buffer), fp)) > 0)
      contents.append(buffer, bytes);
    fclose(fp);
    return contents;
  }

 private:
  static int RemoveEntry(const char *file, const struct stat *, int,
                         struct FTW *)
  {
    return remove(file);
  }

  std::string path_;
};

// Permission bits of a file, or -1 when it does not exist.
inline int FileMode(const std::string &file)
{
  struct stat info;
  if (stat(file.c_str(), &info))
    return -1;
  return static_cast<int>(info.st_mode & 07777);
}

}  // namespace filterinst_test

#endif // !_FILTERINST_TEST_HELPERS_H_
