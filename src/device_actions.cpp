/*
 * device_actions.cpp - User commands on devices implementation
 */

#include "device_actions.hpp"
#include <spdlog/spdlog.h>

DeviceActions::DeviceActions(StateStore& store, TaskCoordinator& coordinator, DeviceBackends backends)
    : store_(store), coordinator_(coordinator), backends_(std::move(backends)) {}

DeviceManager* DeviceActions::manager_for(Platform platform) {
    DeviceManager* manager = backends_.get(platform);
    if (!manager) {
        store_.notify(NotificationType::ERROR,
                      std::string(platform_name(platform)) + " devices are not supported on this host");
    }
    return manager;
}

void DeviceActions::toggle_selected() {
    std::optional<Device> device = store_.selected_device();
    if (!device) {
        return;
    }

    switch (device->status) {
        case DeviceStatus::STARTING:
        case DeviceStatus::STOPPING:
        case DeviceStatus::CREATING:
            store_.notify(NotificationType::WARNING, "Device '" + device->name + "' is busy");
            return;
        default:
            break;
    }

    if (device->is_running) {
        stop_device(*device);
    } else {
        start_device(*device);
    }
}

void DeviceActions::start_device(const Device& device) {
    DeviceManager* manager = manager_for(device.platform);
    if (!manager) {
        return;
    }

    // A new command supersedes whatever start was still pending
    store_.clear_pending_start();

    std::optional<Device> previous = store_.set_device_status(device.key(), DeviceStatus::STARTING);
    if (!previous) {
        return;
    }
    store_.set_pending_start(device.name);
    store_.set_operation_status("Starting device '" + device.name + "'...");
    spdlog::info("starting {} device {}", platform_name(device.platform), device.identity);

    Device before = *previous;
    coordinator_.run_job("start " + device.identity, [this, manager, device, before]() {
        std::string error;
        if (!manager->start_device(device.identity, error)) {
            spdlog::warn("start of {} failed: {}", device.identity, error);
            store_.restore_device(before);
            store_.clear_pending_start();
            store_.clear_operation_status();
            store_.notify(NotificationType::ERROR,
                          "Failed to start device '" + device.name + "': " + error);
            return;
        }

        store_.notify(NotificationType::INFO, "Starting device '" + device.name + "'...");
        coordinator_.schedule_status_check(device.platform);
    });
}

void DeviceActions::stop_device(const Device& device) {
    DeviceManager* manager = manager_for(device.platform);
    if (!manager) {
        return;
    }

    store_.clear_pending_start();

    std::optional<Device> previous = store_.set_device_status(device.key(), DeviceStatus::STOPPING);
    if (!previous) {
        return;
    }
    store_.set_operation_status("Stopping device '" + device.name + "'...");
    spdlog::info("stopping {} device {}", platform_name(device.platform), device.identity);

    Device before = *previous;
    coordinator_.run_job("stop " + device.identity, [this, manager, device, before]() {
        std::string error;
        bool ok = manager->stop_device(device.identity, error);
        store_.clear_operation_status();

        if (!ok) {
            spdlog::warn("stop of {} failed: {}", device.identity, error);
            store_.restore_device(before);
            store_.notify(NotificationType::ERROR,
                          "Failed to stop device '" + device.name + "': " + error);
            return;
        }

        store_.set_device_status(device.key(), DeviceStatus::STOPPED);
        store_.end_log_stream_for(device.key());
        store_.clear_details_for(device.key());
        store_.notify(NotificationType::SUCCESS, "Device '" + device.name + "' stopped");
        coordinator_.schedule_status_check(device.platform);
    });
}

void DeviceActions::submit_create_form() {
    std::optional<std::pair<Platform, DeviceConfig>> submit = store_.begin_form_submit();
    if (!submit) {
        return;
    }

    Platform platform = submit->first;
    DeviceConfig config = std::move(submit->second);
    DeviceManager* manager = backends_.get(platform);
    if (!manager) {
        store_.finish_form_submit(false, "Platform not supported");
        return;
    }

    store_.clear_pending_start();
    spdlog::info("creating {} device '{}' ({} / {})", platform_name(platform), config.name,
                 config.device_type, config.version);

    coordinator_.run_job("create " + config.name, [this, manager, config]() {
        std::string error;
        if (!manager->create_device(config, error)) {
            spdlog::warn("create of '{}' failed: {}", config.name, error);
            store_.finish_form_submit(false, error);
            store_.notify(NotificationType::ERROR,
                          "Failed to create device '" + config.name + "': " + error);
            return;
        }

        store_.finish_form_submit(true, "");
        store_.notify(NotificationType::SUCCESS, "Device '" + config.name + "' created");
        coordinator_.request_refresh(true);
    });
}

void DeviceActions::confirm_dialog(Mode mode) {
    std::optional<ConfirmDialog> dialog = store_.take_confirm();
    if (!dialog) {
        return;
    }

    if (mode == Mode::CONFIRM_DELETE) {
        delete_device(*dialog);
    } else if (mode == Mode::CONFIRM_WIPE) {
        wipe_device(*dialog);
    }
}

void DeviceActions::delete_device(const ConfirmDialog& dialog) {
    DeviceManager* manager = manager_for(dialog.key.platform);
    if (!manager) {
        return;
    }

    store_.clear_pending_start();

    std::optional<std::pair<size_t, Device>> removed = store_.remove_device(dialog.key);
    if (!removed) {
        return;
    }
    store_.end_log_stream_for(dialog.key);
    coordinator_.on_selection_changed();
    spdlog::info("deleting {} device {}", platform_name(dialog.key.platform), dialog.key.identity);

    size_t index = removed->first;
    Device device = removed->second;
    coordinator_.run_job("delete " + device.identity, [this, manager, index, device]() {
        std::string error;
        bool ok = true;

        // A running device has to be shut down before it can be removed
        if (device.is_running) {
            ok = manager->stop_device(device.identity, error);
        }
        if (ok) {
            ok = manager->delete_device(device.identity, error);
        }

        if (!ok) {
            spdlog::warn("delete of {} failed: {}", device.identity, error);
            store_.insert_device(index, device);
            store_.notify(NotificationType::ERROR,
                          "Failed to delete device '" + device.name + "': " + error);
            return;
        }

        store_.notify(NotificationType::SUCCESS, "Device '" + device.name + "' deleted");
    });
}

void DeviceActions::wipe_device(const ConfirmDialog& dialog) {
    DeviceManager* manager = manager_for(dialog.key.platform);
    if (!manager) {
        return;
    }

    store_.clear_pending_start();
    store_.set_operation_status("Wiping device '" + dialog.name + "'...");
    spdlog::info("wiping {} device {}", platform_name(dialog.key.platform), dialog.key.identity);

    coordinator_.run_job("wipe " + dialog.key.identity, [this, manager, dialog]() {
        std::string error;
        bool ok = manager->wipe_device(dialog.key.identity, error);
        store_.clear_operation_status();

        if (!ok) {
            spdlog::warn("wipe of {} failed: {}", dialog.key.identity, error);
            store_.notify(NotificationType::ERROR,
                          "Failed to wipe device '" + dialog.name + "': " + error);
            return;
        }

        store_.clear_details_for(dialog.key);
        store_.notify(NotificationType::SUCCESS, "Device '" + dialog.name + "' wiped");
    });
}
