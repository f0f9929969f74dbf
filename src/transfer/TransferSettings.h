#pragma once

#include "RedirectablePrint.h"
#include "transfer-pb-constants.h"
#include <string>

/**
 * Persisted settings of the transfer service, kept in prefs/config.proto below the transfer root.
 */
class TransferSettings
{
  public:
    bletransfer_TransferConfig config = bletransfer_TransferConfig_init_zero;

    TransferSettings(RedirectablePrint *console, const char *rootDir);

    /// Load the config, falling back to (and saving) the defaults if it is missing, old or invalid
    void loadFromDisk();

    bool saveToDisk();

    void installDefaultConfig();

    /// Push log level and colour setting to a log sink
    void applyLogSettings(RedirectablePrint *sink) const;

    static bool isValid(const bletransfer_TransferConfig &c);

    std::string getConfigPath() const { return configPath; }

  private:
    RedirectablePrint *console;
    std::string prefsDir;
    std::string configPath;
};
