#include "TransferSettings.h"
#include "FSCommon.h"
#include "FrameSplitter.h"
#include "configuration.h"

TransferSettings::TransferSettings(RedirectablePrint *_console, const char *rootDir)
    : console(_console), prefsDir(buildPath(rootDir, PREFS_DIR)), configPath(buildPath(prefsDir, CONFIG_FILE))
{
    installDefaultConfig();
}

bool TransferSettings::isValid(const bletransfer_TransferConfig &c)
{
    return FrameSplitter::isValidMtu(c.mtu) && c.super_chunk_size > 0 && c.log_level >= bletransfer_TransferConfig_LogLevel_TRACE &&
           c.log_level <= bletransfer_TransferConfig_LogLevel_CRIT;
}

void TransferSettings::installDefaultConfig()
{
    LOG_INFO("Install default TransferConfig");
    config = bletransfer_TransferConfig_init_zero;
    config.version = TRANSFERCONFIG_CUR_VER;
    config.mtu = DEFAULT_MTU;
    config.super_chunk_size = DEFAULT_SUPER_CHUNK_SIZE;
    config.log_level = bletransfer_TransferConfig_LogLevel_INFO;
    config.ascii_logs = false;
}

void TransferSettings::loadFromDisk()
{
    bool discard = true;
    auto state = loadProto(console, configPath.c_str(), bletransfer_TransferConfig_size, sizeof(bletransfer_TransferConfig),
                           &bletransfer_TransferConfig_msg, &config);
    if (state != LoadFileResult::LOAD_SUCCESS) {
        LOG_INFO("No usable config at %s", configPath.c_str());
    } else if (config.version < TRANSFERCONFIG_MIN_VER) {
        LOG_WARN("config %u is old, discard", config.version);
    } else if (!isValid(config)) {
        LOG_WARN("config has invalid values (mtu %u, super-chunk size %u), discard", config.mtu, config.super_chunk_size);
    } else {
        LOG_INFO("Loaded saved config version %u", config.version);
        discard = false;
    }

    if (discard) {
        installDefaultConfig(); // Our in RAM copy might now be corrupt
        if (!saveToDisk())
            LOG_WARN("Running with defaults that could not be saved");
    }
}

bool TransferSettings::saveToDisk()
{
    if (!fsMkdirs(console, prefsDir.c_str()))
        return false;
    return saveProto(console, configPath.c_str(), bletransfer_TransferConfig_size, &bletransfer_TransferConfig_msg, &config);
}

void TransferSettings::applyLogSettings(RedirectablePrint *sink) const
{
    sink->setLogLevel(static_cast<int>(config.log_level));
    sink->setColor(!config.ascii_logs);
}
