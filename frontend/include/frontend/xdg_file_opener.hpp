#pragma once

#include <client/file_opener.hpp>

#include <boost/process/child.hpp>

#include <string>
#include <vector>

/**
 * @brief Opens files with the desktop's default application by launching xdg-open.
 * Launched viewers outlive the client.
 */
class XdgFileOpener : public Client::FileOpener
{
  public:
    explicit XdgFileOpener(std::string program = "xdg-open");
    ~XdgFileOpener() override;

    std::expected<void, Client::ClientError> open(std::filesystem::path const& path) override;

    /**
     * @brief Reaps launchers that have exited.
     */
    void pruneExited();

  private:
    std::string program_;
    std::vector<boost::process::child> children_;
};
