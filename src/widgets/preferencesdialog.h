#ifndef MARGINREADER_PREFERENCESDIALOG_H
#define MARGINREADER_PREFERENCESDIALOG_H

#include <KConfigDialog>

class MarginReaderConfigDialog : public KConfigDialog
{
    Q_OBJECT

public:
    explicit MarginReaderConfigDialog(QWidget *parent);
};

#endif // MARGINREADER_PREFERENCESDIALOG_H
