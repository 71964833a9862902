#ifndef DROP_SETTINGS_H
#define DROP_SETTINGS_H

class QSettings;

/**
 * @brief Options for DragDropManager, persisted under the "DragDrop" group.
 *
 * Keys:
 * "DragDrop/ActivateOnDrop"   - raise and activate the host window after a drop
 * "DragDrop/NativeSeparators" - deliver paths with platform separators
 */
struct DropSettings {
    bool activateOnDrop = true;
    bool nativeSeparators = true;

    static DropSettings load();
    static DropSettings load(QSettings& settings);
    void save() const;
    void save(QSettings& settings) const;
};

#endif // DROP_SETTINGS_H
