#include "drop_settings.h"
#include <QSettings>

DropSettings DropSettings::load() {
    QSettings s("DropFiles", "DropFiles");
    return load(s);
}

DropSettings DropSettings::load(QSettings& settings) {
    DropSettings out;
    settings.beginGroup("DragDrop");
    out.activateOnDrop = settings.value("ActivateOnDrop", out.activateOnDrop).toBool();
    out.nativeSeparators = settings.value("NativeSeparators", out.nativeSeparators).toBool();
    settings.endGroup();
    return out;
}

void DropSettings::save() const {
    QSettings s("DropFiles", "DropFiles");
    save(s);
}

void DropSettings::save(QSettings& settings) const {
    settings.beginGroup("DragDrop");
    settings.setValue("ActivateOnDrop", activateOnDrop);
    settings.setValue("NativeSeparators", nativeSeparators);
    settings.endGroup();
    settings.sync();
}
