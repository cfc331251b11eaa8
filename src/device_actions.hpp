/*
 * device_actions.hpp - User commands on devices
 *
 * Start, stop, create, delete and wipe. Each command updates the state
 * optimistically on the UI thread, then runs the device manager call as a
 * background job. A failed call rolls the optimistic change back and posts
 * exactly one error notification; a successful start or stop schedules a
 * status check to reconcile with what the platform reports.
 */

#pragma once

#include "device_manager.hpp"
#include "state_store.hpp"
#include "task_coordinator.hpp"

class DeviceActions {
public:
    DeviceActions(StateStore& store, TaskCoordinator& coordinator, DeviceBackends backends);

    // Starts the selected device if stopped, stops it if running
    void toggle_selected();

    void start_device(const Device& device);
    void stop_device(const Device& device);

    // Submits the open create form
    void submit_create_form();

    // Executes the open delete/wipe confirmation dialog
    void confirm_dialog(Mode mode);

private:
    StateStore& store_;
    TaskCoordinator& coordinator_;
    DeviceBackends backends_;

    DeviceManager* manager_for(Platform platform);
    void delete_device(const ConfirmDialog& dialog);
    void wipe_device(const ConfirmDialog& dialog);
};
