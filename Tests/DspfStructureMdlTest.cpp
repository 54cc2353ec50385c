/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <QtTest>
#include <DspfStructureMdl.h>
#include <DspfParser.h>
#include "DspfTestLine.h"
using namespace Dspf;

class StructureMdlTest : public QObject
{
    Q_OBJECT
private:
    static QString label(const QModelIndex& i) { return i.data(Qt::DisplayRole).toString(); }
private slots:
    void emptyModel()
    {
        StructureMdl mdl;
        QCOMPARE( mdl.rowCount(), 0 );
        mdl.load( Parser::parseDocument(sampleText()) );
        QCOMPARE( mdl.rowCount(), 2 );
        mdl.clear();
        QCOMPARE( mdl.rowCount(), 0 );
    }

    void recordsGroupWithoutRecords()
    {
        StructureMdl mdl;
        mdl.load( Parser::parseDocument( TestLine().keyword("DSPSIZ(24 80 *DS3)") ) );
        QCOMPARE( mdl.rowCount(), 2 );
        const QModelIndex records = mdl.index(1, 0);
        QCOMPARE( label(records), QString("Records") );
        QCOMPARE( mdl.rowCount(records), 0 );
        QCOMPARE( mdl.rowCount(mdl.index(0, 0)), 1 );
    }

    void tree()
    {
        StructureMdl mdl;
        mdl.load( Parser::parseDocument(sampleText()), "CUSTMNT.dspf" );
        QCOMPARE( mdl.rowCount(), 2 );

        const QModelIndex file = mdl.index(0, 0);
        QCOMPARE( label(file), QString("File (CUSTMNT.dspf)") );
        QCOMPARE( file.data(Qt::ToolTipRole).toString(), QString("file") );
        QCOMPARE( mdl.rowCount(file), 1 );
        const QModelIndex fileAttrs = mdl.index(0, 0, file);
        QCOMPARE( label(fileAttrs), QString("Attributes") );
        QCOMPARE( mdl.rowCount(fileAttrs), 2 );
        QCOMPARE( label(mdl.index(0, 0, fileAttrs)), QString("DSPSIZ(24 80 *DS3 27 132 *DS4)") );
        QCOMPARE( mdl.index(1, 0, fileAttrs).data(StructureMdl::LineRole).toInt(), 1 );

        const QModelIndex records = mdl.index(1, 0);
        QCOMPARE( label(records), QString("Records") );
        QCOMPARE( mdl.rowCount(records), 2 );
        QVERIFY( !records.data(StructureMdl::LineRole).isValid() );

        const QModelIndex cust = mdl.index(0, 0, records);
        QCOMPARE( label(cust), QString("CUSTREC") );
        QCOMPARE( cust.data(Qt::ToolTipRole).toString(), QString("record") );
        QCOMPARE( cust.data(StructureMdl::LineRole).toInt(), 3 );
        QCOMPARE( mdl.parent(cust), records );
        QCOMPARE( mdl.rowCount(cust), 2 );
        QCOMPARE( label(mdl.index(0, 0, cust)), QString("Attributes") );

        const QModelIndex items = mdl.index(1, 0, cust);
        QCOMPARE( label(items), QString("Fields and Constants") );
        QCOMPARE( mdl.rowCount(items), 3 );
        QCOMPARE( label(mdl.index(0, 0, items)), QString("'Customer'") );
        QCOMPARE( mdl.index(0, 0, items).data(Qt::ToolTipRole).toString(), QString("constant") );
        QCOMPARE( mdl.index(0, 0, items).data(StructureMdl::DescriptionRole).toString(), QString("[01,02]") );

        const QModelIndex custno = mdl.index(1, 0, items);
        QCOMPARE( label(custno), QString("CUSTNO") );
        QCOMPARE( custno.data(StructureMdl::DescriptionRole).toString(), QString("(6)S [20,03]") );
        QCOMPARE( custno.data(StructureMdl::LineRole).toInt(), 7 );
        QCOMPARE( mdl.parent(mdl.parent(custno)), cust );
        QCOMPARE( mdl.rowCount(custno), 2 );

        const QModelIndex inds = mdl.index(0, 0, custno);
        QCOMPARE( label(inds), QString("Indicators") );
        QCOMPARE( mdl.rowCount(inds), 2 );
        QCOMPARE( label(mdl.index(0, 0, inds)), QString("01: ON") );
        QCOMPARE( label(mdl.index(1, 0, inds)), QString("02: OFF") );

        const QModelIndex attrs = mdl.index(1, 0, custno);
        QCOMPARE( mdl.rowCount(attrs), 2 );
        const QModelIndex red = mdl.index(1, 0, attrs);
        QCOMPARE( label(red), QString("COLOR(RED)") );
        QCOMPARE( red.data(StructureMdl::LineRole).toInt(), 8 );
        QCOMPARE( red.data(StructureMdl::DescriptionRole).toString(), QString("[N03]") );
        QVERIFY( mdl.getAttribute(red) != 0 );
        QCOMPARE( mdl.getElement(red)->name, QString("CUSTNO") );
        QCOMPARE( mdl.getLine(inds), -1 );

        QVERIFY( !mdl.index(3, 0, items).isValid() );
        QVERIFY( !mdl.index(0, 1, items).isValid() );
    }

    void findRecord()
    {
        StructureMdl mdl;
        mdl.load( Parser::parseDocument(sampleText()) );
        const QModelIndex win = mdl.findRecord("WINREC");
        QVERIFY( win.isValid() );
        QCOMPARE( win.row(), 1 );
        QCOMPARE( win.data(StructureMdl::DescriptionRole).toString(), QString("7x40 at 5,10") );
        QVERIFY( !mdl.findRecord("CUSTNO").isValid() );
    }

    void recordFilter()
    {
        StructureMdl mdl;
        mdl.load( Parser::parseDocument(sampleText()) );
        QSignalSpy reset( &mdl, SIGNAL(modelReset()) );
        mdl.setRecordFilter( QStringList() << "WINREC" );
        QCOMPARE( reset.count(), 1 );
        const QModelIndex records = mdl.index(1, 0);
        QCOMPARE( mdl.rowCount(records), 1 );
        QCOMPARE( label(mdl.index(0, 0, records)), QString("WINREC") );
        QCOMPARE( mdl.findRecord("WINREC").row(), 0 );
        QVERIFY( !mdl.findRecord("CUSTREC").isValid() );

        mdl.showAll();
        QCOMPARE( mdl.rowCount(mdl.index(1, 0)), 2 );
    }

    void kindFilter()
    {
        StructureMdl mdl;
        mdl.load( Parser::parseDocument(sampleText()) );
        mdl.setKindVisible( Element::FieldDecl, false );
        QVERIFY( !mdl.isKindVisible(Element::FieldDecl) );
        QVERIFY( mdl.isKindVisible(Element::ConstDecl) );

        const QModelIndex records = mdl.index(1, 0);
        const QModelIndex cust = mdl.index(0, 0, records);
        const QModelIndex items = mdl.index(1, 0, cust);
        QCOMPARE( mdl.rowCount(items), 1 );
        QCOMPARE( label(mdl.index(0, 0, items)), QString("'Customer'") );

        // no visible items leaves only the attributes group
        const QModelIndex win = mdl.index(1, 0, records);
        QCOMPARE( mdl.rowCount(win), 1 );
        QCOMPARE( label(mdl.index(0, 0, win)), QString("Attributes") );

        mdl.setKindVisible( Element::ConstDecl, false );
        QCOMPARE( mdl.rowCount(mdl.index(0, 0, mdl.index(1, 0))), 1 );
    }
};

QTEST_GUILESS_MAIN(StructureMdlTest)

#include "DspfStructureMdlTest.moc"
