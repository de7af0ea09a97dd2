#pragma once

#include <QLabel>
#include <QMainWindow>
#include <QTimer>
#include <QWidget>
#include <memory>
#include <string>
#include <vector>
#include "SnapshotQueue.hpp"
#include "../engine/Snapshot.hpp"

namespace devwatch::client
{
    // Grid of status discs, COLUMNS per row. DOWN discs are red, a bit larger, and drawn
    // dim on the off phase of the blink clock.
    class HealthMapView : public QWidget
    {
        Q_OBJECT

    public:
        static constexpr int COLUMNS = 7;

        explicit HealthMapView(std::vector<std::string> hostnameSuffixes, QWidget *parent = nullptr);

        void SetSnapshot(engine::SnapshotPtr snapshot);

    protected:
        void paintEvent(QPaintEvent *event) override;

    private:
        std::vector<std::string> m_suffixes;
        engine::SnapshotPtr m_snapshot;
    };

    class HealthMapWindow : public QMainWindow
    {
        Q_OBJECT

    public:
        HealthMapWindow(std::shared_ptr<SnapshotQueue> queue, std::vector<std::string> hostnameSuffixes,
                        QWidget *parent = nullptr);

    private slots:
        void pollSnapshots();

    private:
        void setupUi(std::vector<std::string> hostnameSuffixes);

        std::shared_ptr<SnapshotQueue> m_queue;
        HealthMapView *m_view;
        QLabel *m_statsLabel;
        QTimer *m_pollTimer;
    };
}
